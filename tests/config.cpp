#include "common.hpp"

#include "backend/config.hpp"


TEST_CASE("Config / Defaults are valid") {
    const fgp::config config;

    CHECK_FALSE(config.validate().has_value());

    CHECK(config.flamegraph.sort == "left heavy");
    CHECK(config.flamegraph.collapse == "none");
    CHECK(config.frames.prettify);
    CHECK(config.output.max_name_width == 117);
}

TEST_CASE("Config / Parsing") {
    const fgp::config config = fgp::config::from_string(R"(
version: 0.1.0
flamegraph:
  sort: alphabetical
  inverted: true
  collapse: system frames
  type: flamegraph
frames:
  prettify: false
  replace_prefix:
    - { from: /home/user/project/, to: "" }
    - { from: std::, to: "" }
output:
  max_name_width: 40
  min_percentage: 5
)");

    CHECK_FALSE(config.validate().has_value());

    CHECK(config.flamegraph.sort == "alphabetical");
    CHECK(config.flamegraph.inverted);
    CHECK(config.flamegraph.collapse == "system frames");
    CHECK(config.flamegraph.type == "flamegraph");

    CHECK_FALSE(config.frames.prettify);
    REQUIRE(config.frames.replace_prefix.size() == 2);
    CHECK(config.frames.replace_prefix[0].from == "/home/user/project/");
    CHECK(config.frames.replace_prefix[0].to == "");

    CHECK(config.output.max_name_width == 40);
    CHECK(config.output.min_percentage == 5);

    // Conversion to the backend options
    const fgp::flamegraph_options options = config.make_flamegraph_options();

    CHECK(options.inverted);
    CHECK(options.sort == fgp::sort_order::alphabetical);
    CHECK(static_cast<bool>(options.collapse));

    CHECK(config.make_profile_options().type == fgp::profile_type::flamegraph);
    CHECK_FALSE(config.make_frame_index_options().prettify);
}

TEST_CASE("Config / Partial configs keep defaults") {
    const fgp::config config = fgp::config::from_string("flamegraph:\n  inverted: true\n");

    CHECK(config.flamegraph.inverted);
    CHECK(config.flamegraph.sort == "left heavy");
    CHECK(config.frames.prettify);

    CHECK_FALSE(static_cast<bool>(config.make_flamegraph_options().collapse));
}

TEST_CASE("Config / Validation") {
    const auto invalid = [](auto&& modify) {
        fgp::config config;
        modify(config);
        return config.validate().has_value();
    };

    CHECK(invalid([](fgp::config& c) { c.version = "1.0"; }));
    CHECK(invalid([](fgp::config& c) { c.flamegraph.sort = "random"; }));
    CHECK(invalid([](fgp::config& c) { c.flamegraph.collapse = "everything"; }));
    CHECK(invalid([](fgp::config& c) { c.flamegraph.type = "timeline"; }));
    CHECK(invalid([](fgp::config& c) { c.frames.replace_prefix.push_back({.from = "", .to = "x"}); }));
    CHECK(invalid([](fgp::config& c) { c.output.max_name_width = 2; }));
    CHECK(invalid([](fgp::config& c) { c.output.min_percentage = 101; }));

    // Sort doesn't fit the profile type
    CHECK(invalid([](fgp::config& c) {
        c.flamegraph.sort = "call order";
        c.flamegraph.type = "flamegraph";
    }));
    CHECK(invalid([](fgp::config& c) {
        c.flamegraph.sort = "alphabetical";
        c.flamegraph.type = "flamechart";
    }));
}

TEST_CASE("Config / Serialization") {
    fgp::config config;

    config.flamegraph.sort     = "alphabetical";
    config.flamegraph.type     = "flamegraph";
    config.flamegraph.inverted = true;
    config.frames.replace_prefix.push_back({.from = "/src/", .to = "~/"});

    const fgp::config parsed = fgp::config::from_string(config.to_string());

    CHECK(parsed.version == config.version);
    CHECK(parsed.flamegraph.sort == "alphabetical");
    CHECK(parsed.flamegraph.inverted);
    REQUIRE(parsed.frames.replace_prefix.size() == 1);
    CHECK(parsed.frames.replace_prefix[0].to == "~/");
}

TEST_CASE("Config / Prefix replacement") {
    fgp::config config;

    config.frames.replace_prefix = {{.from = "/home/user/", .to = "~/"}, {.from = "~/project/", .to = ""}};

    CHECK(config.replace_prefixes("/home/user/project/main.cpp") == "main.cpp");
    CHECK(config.replace_prefixes("/opt/main.cpp") == "/opt/main.cpp");
}

TEST_CASE("Config / Errors") {
    CHECK_THROWS_AS(fgp::config::from_file("tests/data/missing-config"), fgp::exception);
    CHECK_THROWS_AS(fgp::config::from_string("flamegraph:\n  inverted: [1, 2"), fgp::exception);
}
