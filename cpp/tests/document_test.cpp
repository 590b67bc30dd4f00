/**
 * Document Tests
 *
 * Edits go through the rule engine and compose; invalid patches leave the
 * document untouched and listeners see every applied change.
 */

#include "tests/delta_test_common.h"
#include "richdoc/document/document.h"
#include <memory>
#include <stdexcept>

using namespace richdoc_test;
using richdoc::delta::Embed;
using richdoc::document::Attribute;
using richdoc::document::ChangeSource;
using richdoc::document::Document;
using richdoc::document::DocumentChange;

namespace {

Document helloWorld() {
    return Document(textDelta("Hello\nWorld\n"));
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

TEST(DocumentTest, DefaultIsSingleNewline) {
    Document doc;
    EXPECT_EQ(doc.toDelta(), textDelta("\n"));
    EXPECT_EQ(doc.length(), 1u);
    EXPECT_EQ(doc.toPlainText(), "\n");
}

TEST(DocumentTest, RejectsInvalidContents) {
    EXPECT_THROW({ Document doc{Delta{}}; }, std::invalid_argument);
    EXPECT_THROW(Document(textDelta("no newline")), std::invalid_argument);

    Delta withRetain;
    withRetain.retain(2).insert("\n");
    EXPECT_THROW(Document(std::move(withRetain)), std::invalid_argument);

    Delta embedLast;
    embedLast.insert("a\n").insert(Embed{"image", "x"});
    EXPECT_THROW(Document(std::move(embedLast)), std::invalid_argument);
}

TEST(DocumentTest, FromJson) {
    Document doc = Document::fromJson(
        R"([{"insert":"Title"},{"insert":"\n","attributes":{"header":1}},{"insert":"body\n"}])");
    EXPECT_EQ(doc.length(), 11u);
    EXPECT_EQ(doc.toDelta()[1].attributes, (AttributeMap{{"header", num(1)}}));

    EXPECT_THROW(Document::fromJson(R"([{"insert":"no newline"}])"), std::invalid_argument);
    EXPECT_THROW(Document::fromJson("[{"), std::runtime_error);
}

// =============================================================================
// Formatting
// =============================================================================

TEST(DocumentTest, FormatHeaderReturnsAppliedPatch) {
    Document doc = helloWorld();
    const Delta patch = doc.format(0, 3, Attribute::header(1));

    Delta expectedPatch;
    expectedPatch.retain(5).retain(1, {{"header", num(1)}});
    EXPECT_EQ(patch, expectedPatch) << dump(patch);

    Delta expected;
    expected.insert("Hello").insert("\n", {{"header", num(1)}}).insert("World\n");
    EXPECT_EQ(doc.toDelta(), expected) << dump(doc.toDelta());
}

TEST(DocumentTest, SwitchingBlockFormatDropsPrevious) {
    Document doc = helloWorld();
    doc.format(0, 0, Attribute::list("bullet"));
    doc.format(0, 0, Attribute::header(1));

    EXPECT_EQ(doc.toDelta()[1].attributes, (AttributeMap{{"header", num(1)}}));
}

TEST(DocumentTest, BoldAcrossLinesSkipsNewline) {
    Document doc = helloWorld();
    doc.format(0, doc.length(), Attribute::bold());

    Delta expected;
    expected.insert("Hello", {{"bold", true}}).insert("\n")
            .insert("World", {{"bold", true}}).insert("\n");
    EXPECT_EQ(doc.toDelta(), expected) << dump(doc.toDelta());
}

TEST(DocumentTest, EmbedStyle) {
    Document doc;
    doc.insert(0, Embed{"image", "cat.png"});
    doc.format(0, 1, Attribute::style("width: 120px"));

    const Delta& contents = doc.toDelta();
    ASSERT_TRUE(contents[0].isEmbed());
    EXPECT_EQ(contents[0].attributes, (AttributeMap{{"style", str("width: 120px")}}));
    EXPECT_THROW(doc.format(0, 2, Attribute::style("x")), std::invalid_argument);
}

TEST(DocumentTest, RangeOutsideDocumentThrows) {
    Document doc = helloWorld();
    EXPECT_THROW(doc.format(13, 0, Attribute::bold()), std::out_of_range);
    EXPECT_THROW(doc.format(10, 3, Attribute::bold()), std::out_of_range);
    EXPECT_THROW(doc.remove(0, 13), std::out_of_range);
    EXPECT_NO_THROW(doc.format(12, 0, Attribute::bold()));
}

TEST(DocumentTest, RangeSplittingSurrogatePairIsRejected) {
    // "a" + U+1F600 + "b\n" + "c" | "d\n" (italic)
    Delta contents;
    contents.insert("a\xF0\x9F\x98\x80" "b\nc").insert("d\n", {{"italic", true}});
    Document doc(contents);
    ASSERT_EQ(doc.length(), 8u);

    EXPECT_THROW(doc.format(0, 2, Attribute::bold()), std::invalid_argument);
    EXPECT_THROW(doc.format(2, 0, Attribute::header(1)), std::invalid_argument);
    EXPECT_THROW(doc.remove(2, 1), std::invalid_argument);
    EXPECT_THROW(doc.insert(2, "x"), std::invalid_argument);
    EXPECT_EQ(doc.toDelta(), contents);

    doc.format(0, 3, Attribute::bold());
    EXPECT_EQ(doc.length(), 8u);
    EXPECT_EQ(doc.toPlainText(), "a\xF0\x9F\x98\x80" "b\ncd\n");
    EXPECT_EQ(doc.toDelta()[0].text, "a\xF0\x9F\x98\x80");
    EXPECT_TRUE(doc.toDelta()[0].hasAttribute("bold"));
}

// =============================================================================
// Selection style
// =============================================================================

class CollectStyleTest : public ::testing::Test {
protected:
    void SetUp() override {
        // "Hello" (bold, italic) | "\n" (header 1) | "World" (bold) | "\n" (bullet list)
        Delta contents;
        contents.insert("Hello", {{"bold", true}, {"italic", true}})
            .insert("\n", {{"header", num(1)}})
            .insert("World", {{"bold", true}})
            .insert("\n", {{"list", str("bullet")}});
        doc = Document(std::move(contents));
    }

    Document doc;
};

TEST_F(CollectStyleTest, RangeInsideOneLine) {
    EXPECT_EQ(doc.collectStyle(0, 5),
              (AttributeMap{{"bold", true}, {"italic", true}, {"header", num(1)}}));
}

TEST_F(CollectStyleTest, RangeAcrossLinesKeepsCommonAttributes) {
    EXPECT_EQ(doc.collectStyle(0, 11), (AttributeMap{{"bold", true}}));
    EXPECT_EQ(doc.collectStyle(6, 6), (AttributeMap{{"bold", true}, {"list", str("bullet")}}));
}

TEST_F(CollectStyleTest, RangeEndingOnNewlineStopsAtThatLine) {
    EXPECT_EQ(doc.collectStyle(3, 3),
              (AttributeMap{{"bold", true}, {"italic", true}, {"header", num(1)}}));
}

TEST_F(CollectStyleTest, CaretUsesPreviousCharacter) {
    EXPECT_EQ(doc.collectStyle(2, 0),
              (AttributeMap{{"bold", true}, {"italic", true}, {"header", num(1)}}));
    EXPECT_EQ(doc.collectStyle(6, 0), (AttributeMap{{"list", str("bullet")}}));
    EXPECT_EQ(doc.collectStyle(0, 0), (AttributeMap{{"header", num(1)}}));
}

TEST_F(CollectStyleTest, FollowsFormatting) {
    doc.format(0, 0, Attribute::list("checked"));
    const AttributeMap style = doc.collectStyle(1, 2);
    ASSERT_NE(style.find("list"), nullptr);
    EXPECT_EQ(*style.find("list"), str("checked"));
    EXPECT_FALSE(style.contains("header"));
}

TEST_F(CollectStyleTest, RangeOutsideDocumentThrows) {
    EXPECT_THROW(doc.collectStyle(10, 5), std::out_of_range);
}

// =============================================================================
// Insert & Remove
// =============================================================================

TEST(DocumentTest, InsertText) {
    Document doc = helloWorld();
    const Delta patch = doc.insert(5, ",", {{"bold", true}});

    Delta expectedPatch;
    expectedPatch.retain(5).insert(",", {{"bold", true}});
    EXPECT_EQ(patch, expectedPatch);
    EXPECT_EQ(doc.toPlainText(), "Hello,\nWorld\n");
}

TEST(DocumentTest, InsertPastLastLineThrows) {
    Document doc = helloWorld();
    EXPECT_THROW(doc.insert(12, "x"), std::out_of_range);
    EXPECT_THROW(doc.insert(12, Embed{"image", "x"}), std::out_of_range);
}

TEST(DocumentTest, RemoveText) {
    Document doc = helloWorld();
    doc.remove(5, 1);
    EXPECT_EQ(doc.toDelta(), textDelta("HelloWorld\n"));
}

TEST(DocumentTest, RemovingFinalNewlineIsRejected) {
    Document doc = helloWorld();
    EXPECT_THROW(doc.remove(11, 1), std::runtime_error);
    EXPECT_EQ(doc.toDelta(), textDelta("Hello\nWorld\n"));
}

TEST(DocumentTest, PlainTextReplacesEmbeds) {
    Document doc = helloWorld();
    doc.insert(6, Embed{"image", "x.png"});
    EXPECT_EQ(doc.toPlainText(), "Hello\n\xEF\xBF\xBCWorld\n");
    EXPECT_EQ(doc.length(), 13u);
}

// =============================================================================
// Compose & Listeners
// =============================================================================

TEST(DocumentTest, InvalidPatchLeavesDocumentUnchanged) {
    Document doc = helloWorld();
    int notified = 0;
    doc.addListener([&](const DocumentChange&) { ++notified; });

    Delta patch;
    patch.retain(20).insert("x");
    EXPECT_THROW(doc.compose(patch, ChangeSource::Remote), std::runtime_error);
    EXPECT_EQ(doc.toDelta(), textDelta("Hello\nWorld\n"));
    EXPECT_EQ(notified, 0);
}

TEST(DocumentTest, ListenersReceiveChange) {
    Document doc = helloWorld();
    std::vector<DocumentChange> seen;
    doc.addListener([&](const DocumentChange& change) { seen.push_back(change); });

    Delta patch;
    patch.retain(6).insert("Big ");
    doc.compose(patch, ChangeSource::Remote);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].before, textDelta("Hello\nWorld\n"));
    EXPECT_EQ(seen[0].change, patch);
    EXPECT_EQ(seen[0].source, ChangeSource::Remote);
    EXPECT_EQ(doc.toPlainText(), "Hello\nBig World\n");

    doc.format(0, 5, Attribute::italic());
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1].source, ChangeSource::Local);
}

TEST(DocumentTest, NoOpFormatDoesNotNotify) {
    Document doc = helloWorld();
    int notified = 0;
    doc.addListener([&](const DocumentChange&) { ++notified; });

    const Delta patch = doc.format(3, 0, Attribute::bold());
    EXPECT_EQ(notified, 0);

    Delta expected;
    expected.retain(3);
    EXPECT_EQ(patch, expected);
}

TEST(DocumentTest, RemoveListener) {
    Document doc = helloWorld();
    int first = 0;
    int second = 0;
    const auto a = doc.addListener([&](const DocumentChange&) { ++first; });
    doc.addListener([&](const DocumentChange&) { ++second; });

    EXPECT_TRUE(doc.removeListener(a));
    EXPECT_FALSE(doc.removeListener(a));

    doc.insert(0, "x");
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST(DocumentTest, ListenerMayUnregisterItself) {
    Document doc = helloWorld();
    int calls = 0;
    std::uint32_t id = 0;
    id = doc.addListener([&](const DocumentChange&) {
        ++calls;
        doc.removeListener(id);
    });

    doc.insert(0, "a");
    doc.insert(0, "b");
    EXPECT_EQ(calls, 1);
}

TEST(DocumentTest, EmptyListenerIsRejected) {
    Document doc;
    EXPECT_THROW(doc.addListener(nullptr), std::invalid_argument);
}

// =============================================================================
// Digest
// =============================================================================

TEST(DocumentTest, DigestFollowsContents) {
    Document a = helloWorld();
    Document b = helloWorld();
    EXPECT_EQ(a.digest(), b.digest());

    a.format(0, 5, Attribute::bold());
    EXPECT_NE(a.digest(), b.digest());

    b.format(0, 5, Attribute::bold());
    EXPECT_EQ(a.digest(), b.digest());

    b.format(0, 5, Attribute::unset("bold"));
    EXPECT_EQ(b.digest(), helloWorld().digest());
}

TEST(DocumentTest, DigestSeesAttributeValues) {
    Document a = helloWorld();
    Document b = helloWorld();
    a.format(0, 0, Attribute::header(1));
    b.format(0, 0, Attribute::header(2));
    EXPECT_NE(a.digest(), b.digest());
}

TEST(DocumentTest, CustomRulesApplyThroughDocument) {
    class FixedLinkRule final : public richdoc::rules::FormatRule {
    public:
        const char* name() const noexcept override { return "mark"; }
        std::optional<Delta> apply(const richdoc::rules::FormatContext& ctx) const override {
            if (ctx.attribute.key != "link") return std::nullopt;
            Delta d;
            d.retain(ctx.index).retain(ctx.length, {{"link", str("https://fixed.example")}});
            return d;
        }
    };

    Document doc = helloWorld();
    doc.rules().addCustomRule(std::make_unique<FixedLinkRule>());
    doc.format(0, 5, Attribute::link("https://ignored.example"));

    EXPECT_EQ(doc.toDelta()[0].attributes, (AttributeMap{{"link", str("https://fixed.example")}}));
}
