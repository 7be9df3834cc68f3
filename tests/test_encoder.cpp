#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>

#include "toonpack.hpp"

using namespace toonpack;

namespace {

NodePtr row(int64_t a, const std::string& b) {
    return Node::make_object({{"id", Node::make_int(a)}, {"name", Node::make_string(b)}});
}

} // namespace

TEST(Encoder, FlatObject) {
    NodePtr value = Node::make_object({
        {"name", Node::make_string("Alice")},
        {"age", Node::make_int(30)},
    });
    EXPECT_EQ(encode(value), "name: Alice\nage: 30");
}

TEST(Encoder, Scalars) {
    NodePtr value = Node::make_object({
        {"t", Node::make_bool(true)},
        {"f", Node::make_bool(false)},
        {"n", Node::make_null()},
        {"d", Node::make_double(1.5)},
        {"w", Node::make_double(2.0)},
        {"neg", Node::make_int(-7)},
    });
    EXPECT_EQ(encode(value), "t: true\nf: false\nn: null\nd: 1.5\nw: 2.0\nneg: -7");
}

TEST(Encoder, RootPrimitive) {
    EXPECT_EQ(encode(Node::make_int(5)), "5");
    EXPECT_EQ(encode(Node::make_string("true")), "\"true\"");
}

TEST(Encoder, EmptyRootObjectIsEmptyDocument) {
    EXPECT_EQ(encode(Node::make_object()), "");
}

TEST(Encoder, EmptyNestedObject) {
    NodePtr value = Node::make_object({{"meta", Node::make_object()}});
    EXPECT_EQ(encode(value), "meta: {}");
}

TEST(Encoder, NestedObject) {
    NodePtr value = Node::make_object({
        {"user", Node::make_object({{"id", Node::make_int(1)}, {"name", Node::make_string("Ann")}})},
    });
    EXPECT_EQ(encode(value), "user:\n  id: 1\n  name: Ann");
}

TEST(Encoder, InlineArray) {
    NodePtr value = Node::make_object({
        {"tags", Node::make_array({Node::make_string("a"), Node::make_string("b"),
                                   Node::make_string("c")})},
    });
    EXPECT_EQ(encode(value), "tags[3]: a,b,c");
}

TEST(Encoder, EmptyArray) {
    NodePtr value = Node::make_object({{"items", Node::make_array()}});
    EXPECT_EQ(encode(value), "items[0]:");
}

TEST(Encoder, TabularArray) {
    NodePtr value = Node::make_array({row(1, "Alice"), row(2, "Bob")});
    EXPECT_EQ(encode(value), "[2]{id,name}:\n  1,Alice\n  2,Bob");
}

TEST(Encoder, TabularAllowsNull) {
    NodePtr value = Node::make_array({
        Node::make_object({{"a", Node::make_int(1)}, {"b", Node::make_null()}}),
        Node::make_object({{"a", Node::make_int(2)}, {"b", Node::make_string("x")}}),
    });
    EXPECT_EQ(encode(value), "[2]{a,b}:\n  1,null\n  2,x");
}

TEST(Encoder, NullMakesArrayNonInline) {
    std::vector<std::string> fields;
    EXPECT_EQ(classify_array({Node::make_int(1), Node::make_null()}, false, fields),
              ArrayForm::BLOCK);
    EXPECT_EQ(classify_array({}, false, fields), ArrayForm::INLINE);
    EXPECT_EQ(classify_array({Node::make_object()}, false, fields), ArrayForm::BLOCK);
    EXPECT_TRUE(fields.empty());
}

TEST(Encoder, BlockListMixedItems) {
    NodePtr value = Node::make_object({
        {"items", Node::make_array({
            Node::make_int(1),
            Node::make_object({{"a", Node::make_int(1)}}),
            Node::make_array({Node::make_int(1), Node::make_int(2)}),
        })},
    });
    EXPECT_EQ(encode(value), "items[3]:\n  - 1\n  - a: 1\n  - [2]: 1,2");
}

TEST(Encoder, ListItemWithNestedObject) {
    NodePtr value = Node::make_array({
        Node::make_object({
            {"a", Node::make_int(1)},
            {"b", Node::make_object({{"c", Node::make_int(2)}})},
        }),
    });
    EXPECT_EQ(encode(value), "[1]:\n  - a: 1\n    b:\n      c: 2");
}

TEST(Encoder, EmptyObjectListItem) {
    NodePtr value = Node::make_array({Node::make_object(), Node::make_int(1)});
    EXPECT_EQ(encode(value), "[2]:\n  -\n  - 1");
}

TEST(Encoder, Quoting) {
    NodePtr value = Node::make_object({
        {"empty", Node::make_string("")},
        {"lit", Node::make_string("null")},
        {"num", Node::make_string("42")},
        {"comma", Node::make_string("a,b")},
        {"colon", Node::make_string("a:b")},
        {"dash", Node::make_string("- x")},
        {"pad", Node::make_string(" pad")},
        {"hash", Node::make_string("note #1")},
        {"nl", Node::make_string("line\nnext")},
        {"plain", Node::make_string("hello world")},
        {"sharp", Node::make_string("C#")},
        {"my key", Node::make_int(1)},
    });
    EXPECT_EQ(encode(value),
              "empty: \"\"\n"
              "lit: \"null\"\n"
              "num: \"42\"\n"
              "comma: \"a,b\"\n"
              "colon: \"a:b\"\n"
              "dash: \"- x\"\n"
              "pad: \" pad\"\n"
              "hash: \"note #1\"\n"
              "nl: \"line\\nnext\"\n"
              "plain: hello world\n"
              "sharp: C#\n"
              "my key: 1");
}

TEST(Encoder, NonFiniteStrict) {
    NodePtr value = Node::make_object({{"x", Node::make_double(std::nan(""))}});
    try {
        encode(value);
        FAIL() << "expected EncodeError";
    } catch (const EncodeError& e) {
        EXPECT_EQ(e.path(), "$.x");
        EXPECT_EQ(e.type(), ErrorType::ENCODING_ERROR);
        EXPECT_STREQ(e.what(), "Non-finite number not allowed in strict mode at $.x");
    }
}

TEST(Encoder, NonFiniteLenient) {
    EncodeOptions opts;
    opts.strict = false;
    NodePtr value = Node::make_object({
        {"x", Node::make_double(std::numeric_limits<double>::infinity())},
    });
    EXPECT_EQ(encode(value, opts), "x: null");
}

TEST(Encoder, NonFiniteInTabularRowReportsRowPath) {
    NodePtr value = Node::make_array({
        Node::make_object({{"a", Node::make_int(1)}, {"b", Node::make_double(1.0)}}),
        Node::make_object({{"a", Node::make_int(2)}, {"b", Node::make_double(std::nan(""))}}),
    });
    try {
        encode(value);
        FAIL() << "expected EncodeError";
    } catch (const EncodeError& e) {
        EXPECT_EQ(e.path(), "$[1].b");
    }
}

TEST(Encoder, PipeDelimiter) {
    EncodeOptions opts;
    opts.delimiter = '|';
    NodePtr value = Node::make_object({
        {"tags", Node::make_array({Node::make_string("a"), Node::make_string("b")})},
    });
    EXPECT_EQ(encode(value, opts), "tags[2|]: a|b");
}

TEST(Encoder, TabDelimiter) {
    EncodeOptions opts;
    opts.delimiter = '\t';
    NodePtr value = Node::make_array({
        Node::make_object({{"a", Node::make_int(1)}, {"b", Node::make_int(2)}}),
    });
    EXPECT_EQ(encode(value, opts), "[1\t]{a\tb}:\n  1\t2");
}

TEST(Encoder, Compact) {
    EncodeOptions opts;
    opts.compact = true;
    NodePtr value = Node::make_object({
        {"a", Node::make_int(1)},
        {"t", Node::make_array({Node::make_string("x"), Node::make_string("y")})},
    });
    EXPECT_EQ(encode(value, opts), "a:1\nt[2]:x,y");
}

TEST(Encoder, LengthMarker) {
    EncodeOptions opts;
    opts.length_marker = true;
    NodePtr value = Node::make_object({
        {"t", Node::make_array({Node::make_int(1), Node::make_int(2)})},
    });
    EXPECT_EQ(encode(value, opts), "t[#2]: 1,2");
    EXPECT_TRUE(node_equal(decode(encode(value, opts)), value));
}

TEST(Encoder, SortKeys) {
    EncodeOptions opts;
    opts.sort_keys = true;
    NodePtr value = Node::make_object({{"b", Node::make_int(1)}, {"a", Node::make_int(2)}});
    EXPECT_EQ(encode(value, opts), "a: 2\nb: 1");
}

TEST(Encoder, DifferentKeyOrderFallsBackToBlockList) {
    NodePtr value = Node::make_array({
        Node::make_object({{"a", Node::make_int(1)}, {"b", Node::make_int(2)}}),
        Node::make_object({{"b", Node::make_int(3)}, {"a", Node::make_int(4)}}),
    });
    EXPECT_EQ(encode(value), "[2]:\n  - a: 1\n    b: 2\n  - b: 3\n    a: 4");

    EncodeOptions opts;
    opts.sort_keys = true;
    EXPECT_EQ(encode(value, opts), "[2]{a,b}:\n  1,2\n  4,3");
}

TEST(Encoder, KeyFolding) {
    EncodeOptions opts;
    opts.key_folding = true;
    NodePtr value = Node::make_object({
        {"a", Node::make_object({{"b", Node::make_object({{"c", Node::make_int(1)}})}})},
    });
    EXPECT_EQ(encode(value, opts), "a.b.c: 1");

    ParseOptions popts;
    popts.expand_paths = true;
    EXPECT_TRUE(node_equal(decode(encode(value, opts), popts), value));
}

TEST(Encoder, KeyFoldingSkipsCollidingSibling) {
    EncodeOptions opts;
    opts.key_folding = true;
    NodePtr value = Node::make_object({
        {"a", Node::make_object({{"b", Node::make_int(1)}})},
        {"a.b", Node::make_int(2)},
    });
    EXPECT_EQ(encode(value, opts), "a:\n  b: 1\na.b: 2");
}

TEST(Encoder, Indent) {
    EncodeOptions opts;
    opts.indent = 4;
    NodePtr value = Node::make_object({
        {"user", Node::make_object({{"id", Node::make_int(1)}})},
    });
    EXPECT_EQ(encode(value, opts), "user:\n    id: 1");

    opts.indent = 0;
    EXPECT_THROW(Encoder bad(opts), std::invalid_argument);
}

TEST(Encoder, StreamNeedsStreamingEncoder) {
    NodePtr value = Node::make_object({
        {"items", make_vector_stream({Node::make_int(1)}, false)},
    });
    try {
        encode(value);
        FAIL() << "expected EncodeError";
    } catch (const EncodeError& e) {
        EXPECT_EQ(e.path(), "$.items");
    }
    EXPECT_TRUE(contains_stream(value));
    EXPECT_FALSE(contains_stream(Node::make_array({Node::make_int(1)})));
}

TEST(Encoder, ParallelRowsMatchSequential) {
    NodePtr value = Node::make_array();
    for (int i = 0; i < 2000; i++) {
        value->array_items.push_back(row(i, "name " + std::to_string(i)));
    }

    EncodeOptions parallel;
    parallel.workers = 4;
    EXPECT_EQ(encode(value, parallel), encode(value));
}

TEST(Encoder, ParallelRowsPropagateErrors) {
    NodePtr value = Node::make_array();
    for (int i = 0; i < 50; i++) {
        value->array_items.push_back(Node::make_object({{"v", Node::make_double(i)}}));
    }
    value->array_items[37]->object_items[0].second = Node::make_double(std::nan(""));

    EncodeOptions opts;
    opts.workers = 4;
    opts.parallelism_threshold = 10;
    try {
        encode(value, opts);
        FAIL() << "expected EncodeError";
    } catch (const EncodeError& e) {
        EXPECT_EQ(e.path(), "$[37].v");
    }
}

TEST(Encoder, EncodeFile) {
    std::string path = ::testing::TempDir() + "toonpack_encoder_test.toon";
    Encoder encoder;
    encoder.encode_file(Node::make_object({{"a", Node::make_int(1)}}), path);

    std::ifstream in(path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text, "a: 1");
    std::remove(path.c_str());

    EXPECT_THROW(encoder.encode_file(Node::make_int(1), "/nonexistent-dir/out.toon"), IoError);
}
