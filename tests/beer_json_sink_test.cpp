// SPDX-License-Identifier: MIT

// tests/beer_json_sink_test.cpp
#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include <rapidjson/document.h>

#include "lib/stream/paginated_stream.hpp"
#include "src/beer_json_sink.hpp"
#include "tests/test_support.hpp"

namespace page_stream {
namespace {

using test::FakePages;
using test::RunSync;

TEST(BeerJsonSinkTest, WritesOneObjectPerBeer) {
    std::ostringstream out;
    BeerJsonSink sink(out);

    sink.OnData(Beer{"Tactical Nuclear Penguin", "Uber Imperial Stout", 32.0});
    sink.OnData(Beer{"Sink The Bismarck!", "IPA For The Dedicated", 41.5});
    sink.OnComplete();

    EXPECT_EQ(out.str(),
        "[{\"name\":\"Tactical Nuclear Penguin\",\"tagline\":\"Uber Imperial Stout\",\"abv\":32.0},"
        "{\"name\":\"Sink The Bismarck!\",\"tagline\":\"IPA For The Dedicated\",\"abv\":41.5}]\n");
    EXPECT_TRUE(sink.finished());
    EXPECT_EQ(sink.count(), 2u);
    EXPECT_FALSE(sink.error().has_value());
}

TEST(BeerJsonSinkTest, EmptyStreamIsEmptyArray) {
    std::ostringstream out;
    BeerJsonSink sink(out);
    sink.OnComplete();
    EXPECT_EQ(out.str(), "[]\n");
    EXPECT_EQ(sink.count(), 0u);
}

TEST(BeerJsonSinkTest, EscapesStrings) {
    std::ostringstream out;
    BeerJsonSink sink(out);
    sink.OnData(Beer{"Quote \"Q\"", "back\\slash", 5.0});
    sink.OnComplete();

    rapidjson::Document doc;
    doc.Parse(out.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsArray());
    EXPECT_STREQ(doc[0]["name"].GetString(), "Quote \"Q\"");
    EXPECT_STREQ(doc[0]["tagline"].GetString(), "back\\slash");
}

TEST(BeerJsonSinkTest, ErrorClosesArrayAndKeepsPrefix) {
    std::ostringstream out;
    BeerJsonSink sink(out);
    sink.OnData(Beer{"Hardcore IPA", "Huge Hops", 16.5});
    sink.OnError(Error{ErrorCode::ServerError, "page 2: HTTP 500"});

    rapidjson::Document doc;
    doc.Parse(out.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsArray());
    EXPECT_EQ(doc.Size(), 1u);

    ASSERT_TRUE(sink.error().has_value());
    EXPECT_EQ(sink.error()->code, ErrorCode::ServerError);
    EXPECT_TRUE(sink.finished());
}

TEST(BeerJsonSinkTest, IgnoresEventsAfterFinish) {
    std::ostringstream out;
    BeerJsonSink sink(out);
    sink.OnComplete();
    sink.OnData(Beer{"Late", "", 20.0});
    sink.OnError(Error{ErrorCode::Timeout, "late"});
    EXPECT_EQ(out.str(), "[]\n");
    EXPECT_FALSE(sink.error().has_value());
}

TEST(BeerJsonSinkTest, InvalidateStopsOutput) {
    std::ostringstream out;
    BeerJsonSink sink(out);
    sink.OnData(Beer{"Kept", "", 20.0});
    sink.Invalidate();
    sink.OnData(Beer{"Dropped", "", 21.0});
    sink.OnComplete();

    EXPECT_FALSE(sink.IsValid());
    EXPECT_EQ(out.str(), "[{\"name\":\"Kept\",\"tagline\":\"\",\"abv\":20.0}");
    EXPECT_EQ(sink.count(), 1u);
    EXPECT_FALSE(sink.finished());
}

TEST(BeerJsonSinkTest, DrainsPaginatedStream) {
    FakePages<Beer> pages{.pages = {
        {Beer{"Strong", "a", 55.0}, Beer{"Weak", "b", 10.0}},
        {Beer{"Medium", "c", 16.5}},
    }};
    PaginatedStream<Beer> stream(pages.AsFetcher(), AbvAbove(15.0));
    std::ostringstream out;
    BeerJsonSink sink(out);

    RunSync(Drain(stream, sink));

    EXPECT_EQ(out.str(),
        "[{\"name\":\"Strong\",\"tagline\":\"a\",\"abv\":55.0},"
        "{\"name\":\"Medium\",\"tagline\":\"c\",\"abv\":16.5}]\n");
    EXPECT_EQ(sink.count(), 2u);
}

}  // namespace
}  // namespace page_stream
