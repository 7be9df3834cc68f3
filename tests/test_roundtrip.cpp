#include <gtest/gtest.h>

#include <string>

#include "toonpack.hpp"

using namespace toonpack;

namespace {

NodePtr sample_document() {
    return Node::make_object({
        {"name", Node::make_string("inventory")},
        {"version", Node::make_double(1.25)},
        {"tags", Node::make_array({Node::make_string("a b"), Node::make_string("x,y"),
                                   Node::make_string("")})},
        {"empty", Node::make_array()},
        {"meta", Node::make_object({
            {"owner", Node::make_string("ops")},
            {"limits", Node::make_object({{"max", Node::make_int(10)}})},
            {"none", Node::make_object()},
        })},
        {"rows", Node::make_array({
            Node::make_object({{"sku", Node::make_string("A-1")}, {"qty", Node::make_int(3)},
                               {"note", Node::make_null()}}),
            Node::make_object({{"sku", Node::make_string("B-2")}, {"qty", Node::make_int(0)},
                               {"note", Node::make_string("fragile: yes")}}),
        })},
        {"items", Node::make_array({
            Node::make_object(),
            Node::make_array({Node::make_int(1), Node::make_int(2)}),
            Node::make_object({
                {"kind", Node::make_string("nested")},
                {"children", Node::make_array({
                    Node::make_array({Node::make_bool(true)}),
                    Node::make_null(),
                })},
            }),
            Node::make_string("-5"),
        })},
    });
}

} // namespace

TEST(RoundTrip, ComplexDocument) {
    NodePtr value = sample_document();
    std::string text = encode(value);
    EXPECT_TRUE(node_equal(decode(text), value)) << text;
}

TEST(RoundTrip, EncodingIsStable) {
    std::string first = encode(sample_document());
    EXPECT_EQ(encode(decode(first)), first);
}

TEST(RoundTrip, AlternateDelimiters) {
    for (char delimiter : {'|', '\t'}) {
        EncodeOptions eopts;
        eopts.delimiter = delimiter;
        ParseOptions popts;
        popts.delimiter = delimiter;

        std::string text = encode(sample_document(), eopts);
        EXPECT_TRUE(node_equal(decode(text, popts), sample_document())) << text;
    }
}

TEST(RoundTrip, QuotedKeys) {
    NodePtr value = Node::make_object({
        {"", Node::make_int(0)},
        {"has space ", Node::make_int(1)},
        {"a:b", Node::make_object({{"[x]", Node::make_int(2)}})},
        {"123", Node::make_array({Node::make_object({{"k,v", Node::make_int(3)}})})},
    });
    std::string text = encode(value);
    EXPECT_TRUE(node_equal(decode(text), value)) << text;
}

TEST(RoundTrip, EscapedStrings) {
    NodePtr value = Node::make_object({
        {"s", Node::make_string("tab\there \"quoted\" back\\slash\r\n")},
        {"lead", Node::make_string("#not a comment")},
        {"unicode", Node::make_string("caf\xc3\xa9")},
    });
    std::string text = encode(value);
    EXPECT_TRUE(node_equal(decode(text), value)) << text;
}

TEST(RoundTrip, NumbersKeepTheirKind) {
    NodePtr value = Node::make_object({
        {"i", Node::make_int(-9007199254740993LL)},
        {"d", Node::make_double(0.1)},
        {"whole", Node::make_double(-3.0)},
        {"big", Node::make_double(1e300)},
    });
    NodePtr back = decode(encode(value));
    EXPECT_EQ(back->get("i")->kind, NodeKind::N_INT);
    EXPECT_EQ(back->get("whole")->kind, NodeKind::N_DOUBLE);
    EXPECT_TRUE(node_equal(back, value));
}

TEST(RoundTrip, ScalarTypesSurviveWithoutAnnotations) {
    NodePtr value = Node::make_object({
        {"count", Node::make_int(100)},
        {"price", Node::make_double(19.99)},
        {"ratio", Node::make_double(2.0)},
        {"active", Node::make_bool(true)},
        {"code", Node::make_string("100")},
        {"flag", Node::make_string("true")},
    });
    std::string text = encode(value);
    EXPECT_EQ(text,
              "count: 100\nprice: 19.99\nratio: 2.0\nactive: true\n"
              "code: \"100\"\nflag: \"true\"");
    NodePtr back = decode(text);
    EXPECT_EQ(back->get("ratio")->kind, NodeKind::N_DOUBLE);
    EXPECT_EQ(back->get("code")->kind, NodeKind::N_STRING);
    EXPECT_TRUE(node_equal(back, value));
}

TEST(RoundTrip, RootForms) {
    NodePtr values[] = {
        Node::make_string("just text"),
        Node::make_array(),
        Node::make_array({Node::make_object({{"a", Node::make_int(1)}})}),
        Node::make_array({Node::make_array(), Node::make_object()}),
    };
    for (const auto& value : values) {
        std::string text = encode(value);
        EXPECT_TRUE(node_equal(decode(text), value)) << text;
    }
}

TEST(RoundTrip, CompactAndIndentedOptions) {
    EncodeOptions eopts;
    eopts.compact = true;
    eopts.indent = 4;
    eopts.length_marker = true;
    ParseOptions popts;
    popts.indent = 4;

    std::string text = encode(sample_document(), eopts);
    EXPECT_TRUE(node_equal(decode(text, popts), sample_document())) << text;
}
