#include "common.hpp"

#include "backend/layout.hpp"


TEST_CASE("Layout / Sort order names") {
    CHECK(fgp::parse_sort_order("call order") == fgp::sort_order::call_order);
    CHECK(fgp::parse_sort_order("left heavy") == fgp::sort_order::left_heavy);
    CHECK(fgp::parse_sort_order("alphabetical") == fgp::sort_order::alphabetical);
    CHECK_THROWS_AS(fgp::parse_sort_order("random"), fgp::exception);

    CHECK(fgp::to_string(fgp::sort_order::left_heavy) == "left heavy");
}

TEST_CASE("Layout / Sort & profile type pairing") {
    using enum fgp::sort_order;
    using enum fgp::profile_type;

    CHECK_NOTHROW(fgp::validate_sort(call_order, flamechart));
    CHECK_NOTHROW(fgp::validate_sort(left_heavy, flamechart));
    CHECK_NOTHROW(fgp::validate_sort(left_heavy, flamegraph));
    CHECK_NOTHROW(fgp::validate_sort(alphabetical, flamegraph));

    CHECK_THROWS_AS(fgp::validate_sort(call_order, flamegraph), fgp::invalid_sort_error);
    CHECK_THROWS_AS(fgp::validate_sort(alphabetical, flamechart), fgp::invalid_sort_error);
}

TEST_CASE("Layout / Merger matches children by frame & collapsed frames") {
    const std::vector<fgp::weighted_stack> samples = {
        {.stack = {{.frame = 0}, {.frame = 1, .collapsed = {2}}}, .weight = 1},
        {.stack = {{.frame = 0}, {.frame = 1, .collapsed = {2}}}, .weight = 2},
        {.stack = {{.frame = 0}, {.frame = 1, .collapsed = {3}}}, .weight = 4},
        {.stack = {{.frame = 0}, {.frame = 1}}, .weight = 8},
    };

    const fgp::call_tree tree = fgp::merge_stacks(samples);

    verify_invariants(tree);

    REQUIRE(tree.get_root().children.size() == 1);

    const auto& f0 = tree.at(tree.get_root().children.front());

    CHECK(f0.total_weight == 15);
    REQUIRE(f0.children.size() == 3);

    CHECK(tree.at(f0.children[0]).collapsed == std::vector<std::size_t>{2});
    CHECK(tree.at(f0.children[0]).total_weight == 3);
    CHECK(tree.at(f0.children[1]).collapsed == std::vector<std::size_t>{3});
    CHECK(tree.at(f0.children[1]).total_weight == 4);
    CHECK(tree.at(f0.children[2]).collapsed.empty());
    CHECK(tree.at(f0.children[2]).total_weight == 8);
}

TEST_CASE("Layout / Left heavy sort is stable") {
    const std::vector<fgp::weighted_stack> samples = {
        {.stack = fgp::make_stack(std::vector<std::size_t>{0}), .weight = 1},
        {.stack = fgp::make_stack(std::vector<std::size_t>{1}), .weight = 3},
        {.stack = fgp::make_stack(std::vector<std::size_t>{2}), .weight = 1},
        {.stack = fgp::make_stack(std::vector<std::size_t>{3}), .weight = 3},
    };

    fgp::call_tree tree = fgp::merge_stacks(samples);

    fgp::sort_left_heavy(tree);

    std::vector<std::size_t> frames;
    for (const std::size_t child : tree.get_root().children) frames.push_back(tree.at(child).frame);

    CHECK(frames == std::vector<std::size_t>{1, 3, 0, 2});
}

TEST_CASE("Layout / Cumulative offsets start at the parent") {
    const std::vector<fgp::weighted_stack> samples = {
        {.stack = fgp::make_stack(std::vector<std::size_t>{0}), .weight = 4},
        {.stack = fgp::make_stack(std::vector<std::size_t>{1, 2}), .weight = 2},
        {.stack = fgp::make_stack(std::vector<std::size_t>{1, 3}), .weight = 1},
    };

    fgp::call_tree tree = fgp::merge_stacks(samples);

    fgp::assign_cumulative_offsets(tree);

    const auto& root = tree.get_root();
    const auto& f0   = tree.at(root.children[0]);
    const auto& f1   = tree.at(root.children[1]);
    const auto& f2   = tree.at(f1.children[0]);
    const auto& f3   = tree.at(f1.children[1]);

    CHECK(root.end == 7);
    CHECK(f0.start == 0);
    CHECK(f0.end == 4);
    CHECK(f1.start == 4);
    CHECK(f1.end == 7);
    CHECK(f2.start == 4);
    CHECK(f2.end == 6);
    CHECK(f3.start == 6);
    CHECK(f3.end == 7);
}

TEST_CASE("Layout / Flatten is post-order") {
    const std::vector<fgp::weighted_stack> samples = {
        {.stack = fgp::make_stack(std::vector<std::size_t>{0, 1}), .weight = 1},
        {.stack = fgp::make_stack(std::vector<std::size_t>{0, 2}), .weight = 1},
        {.stack = fgp::make_stack(std::vector<std::size_t>{3}), .weight = 0}, // zero width
    };

    fgp::call_tree tree = fgp::merge_stacks(samples);

    fgp::assign_cumulative_offsets(tree);

    std::vector<std::size_t> frames;
    for (const std::size_t node : fgp::flatten(tree)) frames.push_back(tree.at(node).frame);

    CHECK(frames == std::vector<std::size_t>{1, 2, 0});
}

TEST_CASE("Layout / Invert reverses stacks") {
    const std::vector<fgp::weighted_stack> samples = {
        {.stack = fgp::make_stack(std::vector<std::size_t>{0, 1}), .weight = 2},
        {.stack = fgp::make_stack(std::vector<std::size_t>{2, 1}), .weight = 3},
    };

    const fgp::call_tree tree = fgp::invert(samples);

    verify_invariants(tree);

    REQUIRE(tree.get_root().children.size() == 1);

    const auto& f1 = tree.at(tree.get_root().children.front());

    CHECK(f1.frame == 1);
    CHECK(f1.total_weight == 5);
    CHECK(f1.self_weight == 0);
    CHECK(f1.children.size() == 2);
}
