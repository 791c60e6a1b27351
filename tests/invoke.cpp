#include "common.hpp"

#include "backend/invoke.hpp"


TEST_CASE("Trace document / Reads evented document") {
    const fgp::trace_document document = fgp::read_trace_document((data_dir / "evented.json").string());

    CHECK(document.platform == "mobile");
    CHECK(document.active_profile_index == 0);
    CHECK(document.shared.frames.size() == 5);
    CHECK(document.shared.frames[0].is_application == true);
    CHECK(document.shared.frames[0].line == 10u);
    REQUIRE(document.profiles.size() == 1);

    const auto* trace = std::get_if<fgp::evented_trace>(&document.profiles[0]);

    REQUIRE(trace != nullptr);
    CHECK(trace->name == "main thread");
    CHECK(trace->end_value == 100);
    CHECK(trace->thread_id == 1);
    CHECK(trace->events.size() == 12);

    const fgp::profile_ptr profile = fgp::load_profile(document, 0);

    verify_invariants(profile->tree);

    CHECK(profile->frames[0].file == "src/main.cpp");
    CHECK(profile->tree.get_root().total_weight == 100);
    CHECK(profile->duration == 100);

    // 'main' spends 5 ms before 'parse' & 10 ms after 'render'
    const std::size_t main = find_child(*profile, profile->tree, fgp::call_tree::root, "main").value();

    CHECK(profile->tree.at(main).self_weight == 15);
    CHECK(child_names(*profile, profile->tree, main) == std::vector<std::string>{"parse", "render"});
}

TEST_CASE("Trace document / Reads sampled document") {
    const fgp::trace_document document = fgp::read_trace_document((data_dir / "sampled.json").string());

    const fgp::profile_ptr profile = fgp::load_profile(document, 0, {.type = fgp::profile_type::flamegraph});

    CHECK(profile->encoding == fgp::profile_encoding::sampled);
    CHECK(profile->unit == fgp::time_unit::microseconds);
    CHECK(profile->thread_id == 7);

    // Native symbols get demangled
    const std::size_t run = find_child(*profile, profile->tree, fgp::call_tree::root, "run()").value();

    CHECK(child_names(*profile, profile->tree, run) == std::vector<std::string>{"app::parse()", "render()"});
    CHECK(profile->tree.get_root().total_weight == 41);
    CHECK(profile->tree.get_root().self_weight == 1);

    const fgp::flamegraph flamegraph{profile, 0,
                                     {.sort = fgp::sort_order::alphabetical, .collapse = fgp::collapse_system_frames}};

    const std::size_t run_node   = find_child(*profile, flamegraph.tree(), fgp::call_tree::root, "run()").value();
    const std::size_t parse_node = find_child(*profile, flamegraph.tree(), run_node, "app::parse()").value();
    const std::size_t memcpy     = find_child(*profile, flamegraph.tree(), parse_node, "memcpy").value();

    CHECK(collapsed_names(*profile, flamegraph.tree(), memcpy) == std::vector<std::string>{"read(int)"});
    CHECK(flamegraph.tree().at(memcpy).total_weight == 15);
}

TEST_CASE("Trace document / Selects profiles by index") {
    const fgp::trace_document document = fgp::read_trace_document((data_dir / "mixed.json").string());

    CHECK(document.platform == "javascript");
    CHECK(document.active_profile_index == 1);
    REQUIRE(document.profiles.size() == 2);

    // Evented profile closes the frame through a duplicate descriptor
    const fgp::profile_ptr ui = fgp::load_profile(document, 0);

    CHECK(ui->name == "ui");
    CHECK(ui->duration == 10);
    CHECK(ui->tree.size() == 2);

    // Sampled profile names the anonymous frame
    const fgp::profile_ptr worker = fgp::load_profile(document, document.active_profile_index);

    CHECK(worker->name == "worker");
    CHECK(child_names(*worker, worker->tree, fgp::call_tree::root) == std::vector<std::string>{"<anonymous>"});

    CHECK_THROWS_AS(fgp::load_profile(document, 2), fgp::exception);
}

TEST_CASE("Trace document / Parses documents from strings") {
    const fgp::trace_document document = fgp::parse_trace_document(R"({
        "shared": { "frames": [{ "name": "f0" }] },
        "profiles": [{
            "type": "sampled", "name": "profile", "startValue": 0, "endValue": 2, "unit": "milliseconds",
            "threadID": 0, "weights": [2], "samples": [[0]], "unknownField": 42
        }]
    })");

    CHECK(document.platform == "mobile"); // default
    CHECK(std::holds_alternative<fgp::sampled_trace>(document.profiles.at(0)));
}

TEST_CASE("Trace document / Rejects malformed documents") {
    CHECK_THROWS_AS(fgp::parse_trace_document("{ \"profiles\": [ }"), fgp::invalid_trace_error);
    CHECK_THROWS_AS(fgp::read_trace_document((data_dir / "invalid_schema.json").string()), fgp::invalid_trace_error);
    CHECK_THROWS_AS(fgp::read_trace_document((data_dir / "does_not_exist.json").string()), fgp::invalid_trace_error);

    // Document is fine, the profile is not
    const fgp::trace_document document = fgp::read_trace_document((data_dir / "invalid_unbalanced.json").string());

    CHECK_THROWS_WITH_AS(fgp::load_profile(document, 0), doctest::Contains("Unbalanced append order stack"),
                         fgp::unbalanced_stack_error);
}
