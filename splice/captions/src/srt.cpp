/**
 * @file srt.cpp
 * @brief SubRip parsing and formatting
 */

#include <splice/captions/srt.hpp>

#include <splice/core/logger.hpp>

#include <cctype>
#include <sstream>

#include <spdlog/fmt/fmt.h>

namespace spl::captions {

namespace {

constexpr Tick kTicksPerMs = kTicksPerSecond / 1000;

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

/// Split on blank lines; strips '\r'
std::vector<std::vector<std::string>> splitBlocks(const std::string& text) {
    std::vector<std::vector<std::string>> blocks;
    std::vector<std::string> current;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) {
            if (!current.empty()) {
                blocks.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(line);
    }
    if (!current.empty()) {
        blocks.push_back(std::move(current));
    }
    return blocks;
}

} // anonymous namespace

std::string formatSrtTimestamp(Tick tick) {
    if (tick < 0) tick = 0;
    const int64_t totalMs = tick / kTicksPerMs;
    const int64_t ms = totalMs % 1000;
    const int64_t totalSeconds = totalMs / 1000;
    const int64_t seconds = totalSeconds % 60;
    const int64_t minutes = (totalSeconds / 60) % 60;
    const int64_t hours = totalSeconds / 3600;
    return fmt::format("{:02}:{:02}:{:02},{:03}", hours, minutes, seconds, ms);
}

Result<Tick> parseSrtTimestamp(const std::string& text) {
    const std::string s = trim(text);

    // H+:MM:SS,mmm
    size_t firstColon = s.find(':');
    if (firstColon == std::string::npos || firstColon == 0) {
        return Err<Tick>(ErrorCode::ParseError, "Bad SRT timestamp '" + text + "'");
    }
    if (s.size() != firstColon + 10 || s[firstColon + 3] != ':' ||
        (s[firstColon + 6] != ',' && s[firstColon + 6] != '.')) {
        return Err<Tick>(ErrorCode::ParseError, "Bad SRT timestamp '" + text + "'");
    }

    auto digits = [&](size_t pos, size_t count, int64_t& out) {
        out = 0;
        for (size_t i = pos; i < pos + count; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
            out = out * 10 + (s[i] - '0');
        }
        return true;
    };

    int64_t hours = 0, minutes = 0, seconds = 0, ms = 0;
    if (!digits(0, firstColon, hours) ||
        !digits(firstColon + 1, 2, minutes) ||
        !digits(firstColon + 4, 2, seconds) ||
        !digits(firstColon + 7, 3, ms) ||
        minutes > 59 || seconds > 59) {
        return Err<Tick>(ErrorCode::ParseError, "Bad SRT timestamp '" + text + "'");
    }

    return ((hours * 3600 + minutes * 60 + seconds) * 1000 + ms) * kTicksPerMs;
}

Result<std::vector<model::Caption>> parseSrt(const std::string& text) {
    std::vector<model::Caption> cues;
    auto blocks = splitBlocks(text);

    size_t skipped = 0;
    for (const auto& block : blocks) {
        // Index line is optional in the wild; find the arrow line
        size_t timing = block.size();
        for (size_t i = 0; i < block.size() && i < 2; ++i) {
            if (block[i].find("-->") != std::string::npos) {
                timing = i;
                break;
            }
        }
        if (timing >= block.size() - 1) {
            ++skipped;
            continue;
        }

        const std::string& line = block[timing];
        size_t arrow = line.find("-->");
        auto start = parseSrtTimestamp(line.substr(0, arrow));
        auto end = parseSrtTimestamp(line.substr(arrow + 3));
        if (!start || !end) {
            ++skipped;
            continue;
        }

        std::string joined;
        for (size_t i = timing + 1; i < block.size(); ++i) {
            if (!joined.empty()) joined += ' ';
            joined += trim(block[i]);
        }

        model::Caption cue;
        cue.id = UUID::generate();
        cue.startTick = start.value();
        cue.endTick = end.value();
        cue.text = std::move(joined);
        cues.push_back(std::move(cue));
    }

    if (cues.empty() && !blocks.empty()) {
        return Err<std::vector<model::Caption>>(ErrorCode::ParseError, "No SRT cues found");
    }
    if (skipped > 0) {
        LOG_WARN("Skipped {} malformed SRT blocks", skipped);
    }
    return cues;
}

std::string toSrt(const model::CaptionTrack& captions) {
    std::string out;
    size_t index = 1;
    for (const auto& cue : captions.cues) {
        out += fmt::format("{}\n{} --> {}\n{}\n\n", index++,
                           formatSrtTimestamp(cue.startTick),
                           formatSrtTimestamp(cue.endTick),
                           cue.text);
    }
    return out;
}

} // namespace spl::captions
