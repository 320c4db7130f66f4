/**
 * @file timeline_io.cpp
 * @brief Timeline serialization implementation
 */

#include <splice/model/io/timeline_io.hpp>
#include <splice/model/media_asset_registry.hpp>

#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace spl::model {

// ============================================================================
// JSON Serialization Helpers
// ============================================================================

namespace {

// UUID
json uuidToJson(const UUID& uuid) {
    return uuid.toString();
}

UUID uuidFromJson(const json& j) {
    auto parsed = UUID::parse(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("malformed id '" + j.get<std::string>() + "'");
    }
    return *parsed;
}

// Enums
TrackKind trackKindFromString(const std::string& name) {
    if (name == "video") return TrackKind::Video;
    if (name == "audio") return TrackKind::Audio;
    if (name == "caption") return TrackKind::Caption;
    throw std::invalid_argument("unknown track kind '" + name + "'");
}

SourceKind sourceKindFromString(const std::string& name) {
    if (name == "none") return SourceKind::None;
    if (name == "asset") return SourceKind::Asset;
    if (name == "caption") return SourceKind::CaptionCue;
    throw std::invalid_argument("unknown source kind '" + name + "'");
}

// Element
json elementToJson(const Element& element) {
    json source = {{"kind", sourceKindToString(element.source.kind)}};
    if (element.source.kind != SourceKind::None) {
        source["id"] = uuidToJson(element.source.id);
    }

    return {
        {"id", uuidToJson(element.id)},
        {"name", element.name},
        {"start", element.startTick},
        {"duration", element.durationTicks},
        {"trimIn", element.trimInTicks},
        {"trimOut", element.trimOutTicks},
        {"source", source}
    };
}

Element elementFromJson(const json& j, const UUID& trackId) {
    Element element;
    element.id = uuidFromJson(j.at("id"));
    element.trackId = trackId;
    element.name = j.value("name", "");
    element.startTick = j.at("start").get<Tick>();
    element.durationTicks = j.at("duration").get<TickDuration>();
    element.trimInTicks = j.value("trimIn", Tick(0));
    element.trimOutTicks = j.value("trimOut", Tick(0));

    if (j.contains("source")) {
        const auto& source = j["source"];
        element.source.kind = sourceKindFromString(source.value("kind", "none"));
        if (element.source.kind != SourceKind::None) {
            element.source.id = uuidFromJson(source.at("id"));
        }
    }
    return element;
}

// Track
json trackToJson(const Track& track) {
    json elementsJson = json::array();
    for (const auto& element : track.elements) {
        elementsJson.push_back(elementToJson(element));
    }

    json j = {
        {"id", uuidToJson(track.id)},
        {"name", track.name},
        {"kind", trackKindToString(track.kind)},
        {"enabled", track.enabled},
        {"elements", elementsJson}
    };
    if (track.captionTrackId) {
        j["captionTrackId"] = uuidToJson(*track.captionTrackId);
    }
    return j;
}

Track trackFromJson(const json& j) {
    Track track;
    track.id = uuidFromJson(j.at("id"));
    track.name = j.value("name", "");
    track.kind = trackKindFromString(j.value("kind", "video"));
    track.enabled = j.value("enabled", true);
    if (j.contains("captionTrackId")) {
        track.captionTrackId = uuidFromJson(j["captionTrackId"]);
    }

    if (j.contains("elements")) {
        for (const auto& elementJson : j["elements"]) {
            track.elements.push_back(elementFromJson(elementJson, track.id));
        }
    }
    return track;
}

// CaptionTrack
json captionTrackToJson(const CaptionTrack& captions) {
    json cuesJson = json::array();
    for (const auto& cue : captions.cues) {
        cuesJson.push_back({
            {"id", uuidToJson(cue.id)},
            {"start", cue.startTick},
            {"end", cue.endTick},
            {"text", cue.text}
        });
    }

    return {
        {"id", uuidToJson(captions.id)},
        {"language", captions.language},
        {"cues", cuesJson}
    };
}

CaptionTrack captionTrackFromJson(const json& j) {
    CaptionTrack captions;
    captions.id = uuidFromJson(j.at("id"));
    captions.language = j.value("language", "");

    if (j.contains("cues")) {
        for (const auto& cueJson : j["cues"]) {
            Caption cue;
            cue.id = uuidFromJson(cueJson.at("id"));
            cue.startTick = cueJson.at("start").get<Tick>();
            cue.endTick = cueJson.at("end").get<Tick>();
            cue.text = cueJson.value("text", "");
            captions.cues.push_back(std::move(cue));
        }
    }
    return captions;
}

} // anonymous namespace

// ============================================================================
// TimelineDocument
// ============================================================================

TimelineDocument TimelineDocument::capture(const Timeline& timeline,
                                           const MediaAssetRegistry* registry) {
    auto snapshot = timeline.snapshot();

    TimelineDocument document;
    document.tracks = snapshot->tracks;
    for (const auto& [id, captions] : snapshot->captionTracks) {
        document.captionTracks.push_back(captions);
    }
    document.playheadTick = timeline.playhead();

    std::set<UUID> seen;
    for (const auto& track : snapshot->tracks) {
        for (const auto& element : track.elements) {
            if (element.source.kind != SourceKind::Asset) continue;
            if (!seen.insert(element.source.id).second) continue;

            AssetReference ref{element.source.id, {}};
            if (registry) {
                if (auto asset = registry->find(element.source.id)) {
                    ref.descriptor = asset->descriptor;
                }
            }
            document.assets.push_back(std::move(ref));
        }
    }
    return document;
}

Result<void> TimelineDocument::applyTo(Timeline& timeline) const {
    return timeline.restore(tracks, captionTracks, playheadTick);
}

// ============================================================================
// TimelineIO Implementation
// ============================================================================

json TimelineIO::toJson(const TimelineDocument& document) {
    json assetsJson = json::array();
    for (const auto& asset : document.assets) {
        assetsJson.push_back({{"id", uuidToJson(asset.id)}, {"descriptor", asset.descriptor}});
    }

    json tracksJson = json::array();
    for (const auto& track : document.tracks) {
        tracksJson.push_back(trackToJson(track));
    }

    json captionsJson = json::array();
    for (const auto& captions : document.captionTracks) {
        captionsJson.push_back(captionTrackToJson(captions));
    }

    return {
        {"formatVersion", kFormatVersion},
        {"playhead", document.playheadTick},
        {"assets", assetsJson},
        {"tracks", tracksJson},
        {"captionTracks", captionsJson}
    };
}

Result<TimelineDocument> TimelineIO::fromJson(const json& root) {
    try {
        if (!root.is_object()) {
            return Error(ErrorCode::InvalidData, "Timeline document must be a JSON object");
        }

        int version = root.value("formatVersion", 0);
        if (version > kFormatVersion) {
            return Error(ErrorCode::NotSupported,
                "Timeline document version " + std::to_string(version) +
                " is newer than supported version " + std::to_string(kFormatVersion));
        }

        TimelineDocument document;
        document.playheadTick = root.value("playhead", Tick(0));

        if (root.contains("assets")) {
            for (const auto& assetJson : root["assets"]) {
                document.assets.push_back({uuidFromJson(assetJson.at("id")),
                                           assetJson.value("descriptor", "")});
            }
        }

        if (root.contains("tracks")) {
            for (const auto& trackJson : root["tracks"]) {
                document.tracks.push_back(trackFromJson(trackJson));
            }
        }

        if (root.contains("captionTracks")) {
            for (const auto& captionsJson : root["captionTracks"]) {
                document.captionTracks.push_back(captionTrackFromJson(captionsJson));
            }
        }

        return document;
    }
    catch (const json::exception& e) {
        return Error(ErrorCode::InvalidData, "Timeline JSON error: " + std::string(e.what()));
    }
    catch (const std::invalid_argument& e) {
        return Error(ErrorCode::InvalidData, e.what());
    }
}

std::string TimelineIO::toString(const TimelineDocument& document) {
    return toJson(document).dump(2);
}

Result<TimelineDocument> TimelineIO::fromString(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    }
    catch (const json::parse_error& e) {
        return Error(ErrorCode::ParseError, "JSON parse error: " + std::string(e.what()));
    }
    return fromJson(root);
}

void TimelineIO::remapAssets(TimelineDocument& document, const std::map<UUID, UUID>& idMap) {
    for (auto& asset : document.assets) {
        if (auto it = idMap.find(asset.id); it != idMap.end()) {
            asset.id = it->second;
        }
    }
    for (auto& track : document.tracks) {
        for (auto& element : track.elements) {
            if (element.source.kind != SourceKind::Asset) continue;
            if (auto it = idMap.find(element.source.id); it != idMap.end()) {
                element.source.id = it->second;
            }
        }
    }
}

} // namespace spl::model
