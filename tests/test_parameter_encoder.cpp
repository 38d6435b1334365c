/// @file test_parameter_encoder.cpp
/// Unit tests for parameter_encoder.hpp: nested form encoding, resource
/// collapsing and the per-request memoizing encoder.

#include "parameter_encoder.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace supercast;
using json = nlohmann::json;

// ============================================================================
// flattenParameters / encodeParameters
// ============================================================================

TEST(EncodeParameters, NestedArraysAndObjects) {
    json params = {{"a", {1, 2}}, {"b", {{"c", 3}}}};
    EXPECT_EQ(encodeParameters(params), "a[0]=1&a[1]=2&b[c]=3");
}

TEST(EncodeParameters, KeysComeOutSorted) {
    json params = {{"zeta", 1}, {"alpha", 2}, {"mid", 3}};
    EXPECT_EQ(encodeParameters(params), "alpha=2&mid=3&zeta=1");
}

TEST(EncodeParameters, ArrayOfObjectsIsIndexed) {
    json params = {{"tags", json::array({{{"name", "x"}}, {{"name", "y"}}})}};
    EXPECT_EQ(encodeParameters(params), "tags[0][name]=x&tags[1][name]=y");
}

TEST(EncodeParameters, ScalarRendering) {
    json params = {
        {"flag", true},
        {"off", false},
        {"none", nullptr},
        {"n", -4},
        {"ratio", 0.5}
    };
    EXPECT_EQ(encodeParameters(params), "flag=true&n=-4&none=&off=false&ratio=0.5");
}

TEST(EncodeParameters, ValuesAreEscapedKeysKeepBrackets) {
    json params = {{"episode", {{"title", "Hello & welcome"}}}};
    EXPECT_EQ(encodeParameters(params), "episode[title]=Hello+%26+welcome");
}

TEST(EncodeParameters, EmptyAndNullGiveEmptyString) {
    EXPECT_EQ(encodeParameters(json::object()), "");
    EXPECT_EQ(encodeParameters(json()), "");
}

TEST(EncodeParameters, EmptyContainersProduceNothing) {
    json params = {{"list", json::array()}, {"map", json::object()}, {"k", "v"}};
    EXPECT_EQ(encodeParameters(params), "k=v");
}

TEST(FlattenParameters, NonObjectThrows) {
    EXPECT_THROW(flattenParameters(json::array({1, 2})), std::invalid_argument);
    EXPECT_THROW(flattenParameters(json("a=1")), std::invalid_argument);
}

TEST(FlattenParameters, PairsUnescaped) {
    auto pairs = flattenParameters({{"q", "a b"}});
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].first, "q");
    EXPECT_EQ(pairs[0].second, "a b");
}

// ============================================================================
// objectsToIds
// ============================================================================

TEST(ObjectsToIds, CollapsesNestedResources) {
    json params = {
        {"episode", {{"object", "episode"}, {"id", 5}, {"title", "ignored"}}},
        {"title", "kept"}
    };

    json out = objectsToIds(params);
    EXPECT_EQ(out["episode"], 5);
    EXPECT_EQ(out["title"], "kept");
}

TEST(ObjectsToIds, CollapsesInsideArraysAndObjects) {
    json params = {
        {"episodes", json::array({
            {{"object", "episode"}, {"id", 1}},
            {{"object", "episode"}, {"id", 2}}
        })},
        {"filter", {{"owner", {{"object", "user"}, {"id", "usr_9"}}}}}
    };

    json out = objectsToIds(params);
    EXPECT_EQ(out["episodes"], json::array({1, 2}));
    EXPECT_EQ(out["filter"]["owner"], "usr_9");
}

TEST(ObjectsToIds, PlainObjectsUntouched) {
    json params = {
        {"meta", {{"id", 3}, {"kind", "x"}}},       // no "object" tag
        {"tagged", {{"object", 1}, {"id", 3}}}       // tag is not a string
    };

    EXPECT_EQ(objectsToIds(params), params);
}

TEST(ObjectsToIds, TopLevelIsNeverCollapsed) {
    json params = {{"object", "episode"}, {"id", 4}};
    EXPECT_EQ(objectsToIds(params), params);
}

// ============================================================================
// encodeMultipart / inspectMultipart
// ============================================================================

TEST(EncodeMultipart, FieldsThenFiles) {
    const json params = {{"title", "Pilot"}, {"tags", {"news"}}};
    const std::vector<FilePart> files = {{"audio", "pilot.mp3", "audio/mpeg", "ID3"}};

    EXPECT_EQ(encodeMultipart(params, files, "b0"),
              "--b0\r\n"
              "Content-Disposition: form-data; name=\"tags[0]\"\r\n\r\n"
              "news\r\n"
              "--b0\r\n"
              "Content-Disposition: form-data; name=\"title\"\r\n\r\n"
              "Pilot\r\n"
              "--b0\r\n"
              "Content-Disposition: form-data; name=\"audio\"; filename=\"pilot.mp3\"\r\n"
              "Content-Type: audio/mpeg\r\n\r\n"
              "ID3\r\n"
              "--b0--\r\n");
}

TEST(EncodeMultipart, QuotesInNamesAreEscaped) {
    const std::vector<FilePart> files = {{"f", "a\"b.txt", "text/plain", "x"}};

    const std::string body = encodeMultipart(json::object(), files, "b0");
    EXPECT_NE(body.find("filename=\"a%22b.txt\""), std::string::npos);
}

TEST(EncodeMultipart, EmptyFormIsJustTheCloseDelimiter) {
    EXPECT_EQ(encodeMultipart(json::object(), {}, "b0"), "--b0--\r\n");
}

TEST(InspectMultipart, FilesShownBySize) {
    const std::vector<FilePart> files = {{"audio", "pilot.mp3", "audio/mpeg", "ID3"}};

    EXPECT_EQ(inspectMultipart({{"title", "Pilot"}}, files),
              R"({"audio":"#<file pilot.mp3 audio/mpeg 3 bytes>","title":"Pilot"})");
}

// ============================================================================
// ParamsEncoder
// ============================================================================

TEST(ParamsEncoder, SameObjectEncodedOnce) {
    int calls = 0;
    ParamsEncoder encoder([&calls](const json& params) {
        ++calls;
        return encodeParameters(params);
    });

    json params = {{"page", 2}};
    const std::string& first  = encoder.encode(params);
    const std::string& second = encoder.encode(params);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(first, "page=2");
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(encoder.cachedEntries(), 1u);
}

TEST(ParamsEncoder, DistinctObjectsCachedSeparately) {
    int calls = 0;
    ParamsEncoder encoder([&calls](const json& params) {
        ++calls;
        return encodeParameters(params);
    });

    json body  = {{"title", "Pilot"}};
    json query = {{"title", "Pilot"}};
    encoder.encode(body);
    encoder.encode(query);

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(encoder.cachedEntries(), 2u);
}

TEST(ParamsEncoder, DefaultUsesFormEncoding) {
    ParamsEncoder encoder;
    json params = {{"a", {1, 2}}};
    EXPECT_EQ(encoder.encode(params), "a[0]=1&a[1]=2");
}

TEST(ParamsEncoder, DecodeIsUnsupported) {
    ParamsEncoder encoder;
    EXPECT_THROW(encoder.decode("a=1"), std::logic_error);
}
