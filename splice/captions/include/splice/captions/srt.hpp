/**
 * @file srt.hpp
 * @brief SubRip (.srt) caption interchange
 */

#pragma once

#include <splice/core/result.hpp>
#include <splice/model/caption_track.hpp>

#include <string>
#include <vector>

namespace spl::captions {

/// "HH:MM:SS,mmm" (hours keep counting past 99)
std::string formatSrtTimestamp(Tick tick);

/// Inverse of formatSrtTimestamp; also accepts '.' as the millisecond separator
Result<Tick> parseSrtTimestamp(const std::string& text);

/**
 * @brief Parse SubRip text into cues
 *
 * Blocks are separated by blank lines: an index line, a
 * "start --> end" line and one or more text lines (joined with a
 * space). Malformed blocks are skipped; ParseError only if the input
 * holds text but no block could be read. Cues get fresh ids.
 */
Result<std::vector<model::Caption>> parseSrt(const std::string& text);

/// Render cues as SubRip, numbered from 1
std::string toSrt(const model::CaptionTrack& captions);

} // namespace spl::captions
