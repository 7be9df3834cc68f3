#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "toonpack.hpp"

using namespace toonpack;

namespace {

std::vector<Event> drain(EventParser& parser) {
    std::vector<Event> events;
    while (auto e = parser.next()) {
        events.push_back(std::move(*e));
    }
    return events;
}

std::vector<Event> events_of(const std::string& text, const ParseOptions& opts = ParseOptions()) {
    StringLineSource source(text);
    auto parser = decode_events(source, opts);
    return drain(*parser);
}

std::vector<EventType> types_of(const std::vector<Event>& events) {
    std::vector<EventType> out;
    for (const auto& e : events) out.push_back(e.type);
    return out;
}

std::vector<NodePtr> items_of(const std::string& text, const ParseOptions& opts = ParseOptions()) {
    StringLineSource source(text);
    ItemReader reader = decode_items(source, opts);
    std::vector<NodePtr> items;
    while (NodePtr item = reader.next()) {
        items.push_back(item);
    }
    return items;
}

ParseOptions lenient() {
    ParseOptions opts;
    opts.strict = false;
    return opts;
}

const char* kComplexDocument =
    "name: inventory\n"
    "tags[3]: a b,\"x,y\",\"\"\n"
    "empty[0]:\n"
    "meta:\n"
    "  owner: ops\n"
    "  none: {}\n"
    "  inline: {k: 1, deep: {z: null}}\n"
    "rows[2]{sku,qty}:\n"
    "  A-1,3\n"
    "  B-2,0\n"
    "items[4]:\n"
    "  -\n"
    "  - [2]: 1,2\n"
    "  - kind: nested\n"
    "    children[2]:\n"
    "      - [1]: true\n"
    "      - null\n"
    "    after: x\n"
    "  - text\n"
    "tail:\n"
    "  - 1\n"
    "  - 2";

} // namespace

TEST(EventParser, ObjectEvents) {
    auto events = events_of("name: Alice\nage: 30");
    std::vector<EventType> expected = {
        EventType::START_DOCUMENT, EventType::START_OBJECT,
        EventType::KEY, EventType::VALUE, EventType::KEY, EventType::VALUE,
        EventType::END_OBJECT, EventType::END_DOCUMENT};
    ASSERT_EQ(types_of(events), expected);
    EXPECT_EQ(events[2].key, "name");
    EXPECT_EQ(events[3].value->string_val, "Alice");
    EXPECT_EQ(events[5].value->int_val, 30);
    EXPECT_EQ(events[4].line, 2u);
}

TEST(EventParser, EmptyDocument) {
    std::vector<EventType> expected = {
        EventType::START_DOCUMENT, EventType::START_OBJECT, EventType::END_OBJECT,
        EventType::END_DOCUMENT};
    EXPECT_EQ(types_of(events_of("")), expected);
}

TEST(EventParser, TabularEvents) {
    auto events = events_of("[2]{a,b}:\n  1,2\n  3,4");
    std::vector<EventType> expected = {
        EventType::START_DOCUMENT, EventType::START_ARRAY,
        EventType::START_OBJECT, EventType::KEY, EventType::VALUE, EventType::KEY,
        EventType::VALUE, EventType::END_OBJECT,
        EventType::START_OBJECT, EventType::KEY, EventType::VALUE, EventType::KEY,
        EventType::VALUE, EventType::END_OBJECT,
        EventType::END_ARRAY, EventType::END_DOCUMENT};
    ASSERT_EQ(types_of(events), expected);
    EXPECT_EQ(events[1].length, ArrayLength::known(2));
    EXPECT_EQ(events[11].key, "b");
    EXPECT_EQ(events[12].value->int_val, 4);
}

TEST(EventParser, IndefiniteList) {
    auto events = events_of("items[*]:\n  - 1\n  - 2");
    std::vector<EventType> expected = {
        EventType::START_DOCUMENT, EventType::START_OBJECT, EventType::KEY,
        EventType::START_ARRAY, EventType::VALUE, EventType::VALUE, EventType::END_ARRAY,
        EventType::END_OBJECT, EventType::END_DOCUMENT};
    ASSERT_EQ(types_of(events), expected);
    EXPECT_FALSE(events[3].length.is_known());
}

TEST(EventParser, IndefiniteOnlyForBlockLists) {
    EXPECT_THROW(events_of("[*]: 1,2"), ParseError);
    EXPECT_THROW(events_of("[*]{a}:\n  1"), ParseError);
}

TEST(EventParser, StrictRowWidth) {
    EXPECT_THROW(events_of("[1]{a,b}:\n  1"), ValidationError);
    EXPECT_THROW(events_of("[1]{a,b}:\n  1,2,3"), ValidationError);
}

TEST(EventParser, StrictOverflowStopsEarly) {
    try {
        events_of("[1]:\n  - 1\n  - 2");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("got more than 1"), std::string::npos);
    }
}

TEST(EventParser, LenientShortRowPadsNull) {
    StringLineSource source("[1]{a,b}:\n  1");
    auto parser = decode_events(source, lenient());
    auto events = drain(*parser);
    std::vector<EventType> expected = {
        EventType::START_DOCUMENT, EventType::START_ARRAY, EventType::START_OBJECT,
        EventType::KEY, EventType::VALUE, EventType::KEY, EventType::VALUE,
        EventType::END_OBJECT, EventType::END_ARRAY, EventType::END_DOCUMENT};
    ASSERT_EQ(types_of(events), expected);
    EXPECT_EQ(events[5].key, "b");
    EXPECT_EQ(events[6].value->kind, NodeKind::N_NULL);
    ASSERT_EQ(parser->warnings().size(), 1u);
    EXPECT_EQ(parser->warnings()[0].type, "row_width");
}

TEST(EventParser, LenientLongRowDropsExtraValues) {
    StringLineSource source("[1]{a}:\n  1,2,3");
    ItemReader reader = decode_items(source, lenient());
    NodePtr row = reader.next();
    ASSERT_TRUE(row);
    EXPECT_TRUE(node_equal(row, Node::make_object({{"a", Node::make_int(1)}})));
    EXPECT_FALSE(reader.next());
    ASSERT_EQ(reader.warnings().size(), 1u);
    EXPECT_EQ(reader.warnings()[0].type, "row_width");
}

TEST(EventParser, LenientShortInlineArrayKeepsValues) {
    auto items = items_of("[3]: 1,2", lenient());
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[1]->int_val, 2);
}

TEST(EventParser, LenientHugeDeclaredLengthEmitsOnlyPresentItems) {
    StringLineSource source("[4000000000]:\n  - a");
    ItemReader reader = decode_items(source, lenient());
    NodePtr first = reader.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->string_val, "a");
    EXPECT_FALSE(reader.next());
    EXPECT_EQ(reader.root_length().count, 4000000000u);
    ASSERT_EQ(reader.warnings().size(), 1u);
    EXPECT_EQ(reader.warnings()[0].type, "n_mismatch");
}

TEST(EventParser, DuplicateKeysFollowPolicy) {
    StringLineSource source("a: 1\nb: 2\na: 3");
    ItemReader reader = decode_items(source);
    NodePtr root = reader.next();
    ASSERT_TRUE(root);
    EXPECT_TRUE(node_equal(root, decode("a: 1\nb: 2\na: 3")));
    EXPECT_EQ(root->get("a")->int_val, 3);
    ASSERT_EQ(reader.warnings().size(), 1u);
    EXPECT_EQ(reader.warnings()[0].type, "duplicate_key");

    ParseOptions strict_keys;
    strict_keys.allow_duplicate_keys = false;
    EXPECT_THROW(items_of("a: 1\na: 2", strict_keys), ParseError);
    EXPECT_THROW(items_of("- a: 1\n  a: 2", strict_keys), ParseError);
    EXPECT_THROW(items_of("[1]{a,a}:\n  1,2", strict_keys), ParseError);

    // Same key in sibling objects is fine
    EXPECT_EQ(items_of("- a: 1\n- a: 2", strict_keys).size(), 2u);
}

TEST(EventParser, DuplicateTabularFieldsMatchParser) {
    auto items = items_of("[1]{a,b,a}:\n  1,2,3");
    ASSERT_EQ(items.size(), 1u);
    EXPECT_TRUE(node_equal(items[0], decode("[1]{a,b,a}:\n  1,2,3")->array_items[0]));
    EXPECT_EQ(items[0]->get("a")->int_val, 3);
}

TEST(EventParser, LenientListOverflowKeepsDeclaredItems) {
    StringLineSource source("[1]:\n  - 1\n  - a: 1\n    b: 2");
    ItemReader reader = decode_items(source, lenient());
    NodePtr first = reader.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->int_val, 1);
    EXPECT_FALSE(reader.next());
    ASSERT_EQ(reader.warnings().size(), 1u);
    EXPECT_EQ(reader.warnings()[0].type, "n_mismatch");
}

TEST(EventParser, ErrorsCarryFileName) {
    std::string path = ::testing::TempDir() + "toonpack_events_test.toon";
    {
        std::ofstream out(path);
        out << "a: 1\nb 2\n";
    }
    auto source = open_file_source(path);
    auto parser = decode_events(*source);
    try {
        drain(*parser);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.file(), path);
        EXPECT_EQ(e.line(), 2u);
    }
    std::remove(path.c_str());
}

TEST(ItemReader, MatchesParserForRootObject) {
    auto items = items_of(kComplexDocument);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_TRUE(node_equal(items[0], decode(kComplexDocument)));
}

TEST(ItemReader, RootArrayItemsOneAtATime) {
    const std::string text = "[3]{id,name}:\n  1,a\n  2,b\n  3,c";
    StringLineSource source(text);
    ItemReader reader = decode_items(source);

    NodePtr expected = decode(text);
    for (size_t i = 0; i < 3; i++) {
        NodePtr item = reader.next();
        ASSERT_TRUE(item);
        EXPECT_TRUE(node_equal(item, expected->array_items[i]));
    }
    EXPECT_FALSE(reader.next());
    EXPECT_FALSE(reader.next());
    EXPECT_EQ(reader.root_length(), ArrayLength::known(3));
}

TEST(ItemReader, ExpandPaths) {
    ParseOptions opts;
    opts.expand_paths = true;
    auto items = items_of("[1]:\n  - a.b: 1\n    a.c: 2", opts);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0]->get("a")->get("c")->int_val, 2);
}

TEST(ItemReader, UnboundedSourceIsReadLazily) {
    size_t produced = 0;
    CallbackLineSource source([&produced](std::string& line) {
        line = produced == 0 ? "[*]:" : "  - " + std::to_string(produced);
        produced++;
        return true;
    });

    ItemReader reader = decode_items(source);
    for (int64_t i = 1; i <= 5; i++) {
        NodePtr item = reader.next();
        ASSERT_TRUE(item);
        EXPECT_EQ(item->int_val, i);
    }
    EXPECT_LE(produced, 6u);
    EXPECT_FALSE(reader.root_length().is_known());
}

TEST(ItemReader, FiniteCallbackSource) {
    std::vector<std::string> lines = {"- id: 1", "  tags[2]: x,y", "- id: 2"};
    size_t next_line = 0;
    CallbackLineSource source([&](std::string& line) {
        if (next_line == lines.size()) return false;
        line = lines[next_line++];
        return true;
    });

    ItemReader reader = decode_items(source);
    NodePtr first = reader.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->get("tags")->array_items.size(), 2u);
    NodePtr second = reader.next();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->get("id")->int_val, 2);
    EXPECT_FALSE(reader.next());
}
