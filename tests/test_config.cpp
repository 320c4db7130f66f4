/**
 * @file test_config.cpp
 * @brief Configuration document, editor settings and export settings
 */

#include <catch2/catch.hpp>

#include <splice/core/config.hpp>
#include <splice/engine/export_settings.hpp>

#include <cstdio>
#include <fstream>

using namespace spl;
using json = nlohmann::json;

TEST_CASE("Defaults are available by dotted key", "[config]") {
    Config config;
    config.loadDefaults();

    REQUIRE(config.get<int>("history.undoLimit") == 100);
    REQUIRE(config.get<int>("export.fps.num") == 30);
    REQUIRE(config.get<std::string>("export.quality") == "high");
    REQUIRE(config.get<std::string>("log.level") == "info");
    REQUIRE(config.has("export.maxConsecutiveFrameFailures"));
    REQUIRE_FALSE(config.has("export.nope"));
}

TEST_CASE("Missing or mistyped keys fall back to the default", "[config]") {
    Config config;
    REQUIRE(config.get<int>("missing.key", 7) == 7);

    REQUIRE(config.set<std::string>("export.width", std::string("wide")));
    REQUIRE(config.get<int>("export.width", 640) == 640);
}

TEST_CASE("Set creates nested keys and notifies listeners", "[config]") {
    Config config;
    std::vector<std::string> changed;
    auto id = config.addChangeListener([&](const std::string& key, const json& oldValue, const json& newValue) {
        changed.push_back(key + ":" + oldValue.dump() + "->" + newValue.dump());
    });

    REQUIRE(config.set<int>("export.width", 1280));
    REQUIRE(config.set<int>("export.width", 640));
    REQUIRE(config.get<int>("export.width") == 640);
    REQUIRE(config.getKeys("export") == std::vector<std::string>{"export.width"});
    REQUIRE(changed == std::vector<std::string>{"export.width:null->1280", "export.width:1280->640"});

    config.removeChangeListener(id);
    REQUIRE(config.set<bool>("log.verbose", true));
    REQUIRE(changed.size() == 2);

    REQUIRE(config.remove("log.verbose"));
    REQUIRE_FALSE(config.remove("log.verbose"));
}

TEST_CASE("Validators can refuse values", "[config]") {
    Config config;
    config.setValidator([](const std::string& key, const json& value) {
        return key != "export.width" || (value.is_number_integer() && value.get<int>() > 0);
    });

    REQUIRE_FALSE(config.set<int>("export.width", -4));
    REQUIRE_FALSE(config.has("export.width"));
    REQUIRE(config.set<int>("export.width", -4, false));
    REQUIRE(config.get<int>("export.width") == -4);
}

TEST_CASE("Loading merges over existing values", "[config]") {
    Config config;
    config.loadDefaults();

    REQUIRE(config.loadFromJson({{"export", {{"quality", "low"}}}}));
    REQUIRE(config.get<std::string>("export.quality") == "low");
    REQUIRE(config.get<int>("export.width") == 1920);

    REQUIRE(config.loadFromJson({{"export", {{"width", 320}}}}, false));
    REQUIRE_FALSE(config.has("export.quality"));

    REQUIRE(config.loadFromJson(json::array()).error().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("Configuration files", "[config]") {
    const std::string path = "splice_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"history": {"undoLimit": 12}})";
    }

    Config config;
    config.loadDefaults();
    REQUIRE(config.loadFromFile(path));
    REQUIRE(config.get<int>("history.undoLimit") == 12);
    REQUIRE(config.get<int>("export.height") == 1080);
    std::remove(path.c_str());

    REQUIRE_FALSE(config.loadFromFile("does/not/exist.json"));

    {
        std::ofstream out(path);
        out << "{ broken";
    }
    REQUIRE_FALSE(config.loadFromFile(path));
    std::remove(path.c_str());
}

TEST_CASE("Editor settings clamp invalid values", "[config]") {
    Config config;
    config.loadDefaults();
    REQUIRE(config.set<int>("history.undoLimit", -3));
    REQUIRE(config.set<int>("export.etaWindow", 0));
    REQUIRE(config.set<int>("export.maxConsecutiveFrameFailures", 0));
    REQUIRE(config.set<std::string>("export.quality", std::string("medium")));

    auto settings = EditorSettings::fromConfig(config);
    REQUIRE(settings.undoLimit == 0);
    REQUIRE(settings.etaWindow == 1);
    REQUIRE(settings.maxConsecutiveFrameFailures == 1);
    REQUIRE(settings.exportQuality == "medium");
    REQUIRE(settings.exportWidth == 1920);
}

TEST_CASE("Export settings from editor settings", "[config][export]") {
    EditorSettings editor;
    editor.exportWidth = 1280;
    editor.exportHeight = 720;
    editor.exportFpsNum = 25;
    editor.exportQuality = "low";
    editor.etaWindow = 10;

    auto settings = engine::ExportSettings::fromEditorSettings(editor);
    REQUIRE(settings.width == 1280);
    REQUIRE(settings.frameRate == Rational{25, 1});
    REQUIRE(settings.quality == engine::ExportQuality::Low);
    REQUIRE(settings.videoBitrate() == 2'500'000);
    REQUIRE(settings.etaWindow == 10);
    REQUIRE(settings.validate());

    editor.exportQuality = "ultra";
    REQUIRE(engine::ExportSettings::fromEditorSettings(editor).quality == engine::ExportQuality::High);
}

TEST_CASE("Export settings validation", "[export]") {
    engine::ExportSettings settings;
    REQUIRE(settings.validate());

    SECTION("size") {
        settings.width = 0;
        REQUIRE(settings.validate().error().code() == ErrorCode::InvalidArgument);
    }
    SECTION("frame rate") {
        settings.frameRate = {0, 1};
        REQUIRE(settings.validate().error().code() == ErrorCode::InvalidArgument);
    }
    SECTION("failure threshold") {
        settings.maxConsecutiveFrameFailures = 0;
        REQUIRE(settings.validate().error().code() == ErrorCode::InvalidArgument);
    }
    SECTION("range") {
        settings.range = engine::ExportRange{kTicksPerSecond, kTicksPerSecond};
        REQUIRE(settings.validate().error().code() == ErrorCode::InvalidRange);
    }
}
