#include <gtest/gtest.h>
#include "vellum/core/clock.hpp"
#include "vellum/network/decoder.hpp"
#include "vellum/network/transport.hpp"

using namespace vellum;
using namespace vellum::network;

TEST(HttpHeadersTest, NamesAreCaseInsensitive) {
    HttpHeaders headers;
    headers.set("Content-Type", "image/png");

    EXPECT_TRUE(headers.has("content-type"));
    EXPECT_EQ(headers.get("CONTENT-TYPE"), "image/png");
    EXPECT_FALSE(headers.get("Content-Length").has_value());
}

TEST(HttpHeadersTest, SetReplacesAndAddAppends) {
    HttpHeaders headers;
    headers.add("Accept", "image/png");
    headers.add("accept", "image/webp");
    EXPECT_EQ(headers.get_all("Accept").size(), 2u);

    headers.set("ACCEPT", "*/*");
    EXPECT_EQ(headers.get_all("accept"), std::vector<std::string>{"*/*"});

    headers.remove("Accept");
    EXPECT_TRUE(headers.empty());
}

TEST(HttpHeadersTest, MergeOverridesSameNamedHeaders) {
    HttpHeaders base{{"Accept", "*/*"}, {"X-Client", "vellum"}};
    HttpHeaders extra{{"accept", "application/json"}};

    base.merge(extra);

    EXPECT_EQ(base.size(), 2u);
    EXPECT_EQ(base.get("Accept"), "application/json");
    EXPECT_EQ(base.get("X-Client"), "vellum");
}

TEST(FetchResponseTest, ParsesContentLength) {
    FetchResponse response;
    EXPECT_EQ(response.content_length(), 0u);

    response.headers.set("Content-Length", " 2048");
    EXPECT_EQ(response.content_length(), 2048u);

    response.headers.set("Content-Length", "lots");
    EXPECT_EQ(response.content_length(), 0u);
}

TEST(FetchResponseTest, OkCoversTwoHundredRange) {
    FetchResponse response;
    response.status = 204;
    EXPECT_TRUE(response.ok());
    response.status = 304;
    EXPECT_FALSE(response.ok());
    EXPECT_EQ(status_text_for(404), "Not Found");
}

TEST(MemoryBodyReaderTest, DeliversChunksThenEnd) {
    ManualClock clock;
    EventLoop loop(clock);
    MemoryBodyReader reader(loop, {{1, 2}, {3}});

    std::vector<BodyChunk> received;
    auto collect = [&](ResourceResult<BodyChunk> result) {
        ASSERT_TRUE(result.is_ok());
        received.push_back(result.value());
    };
    reader.read(collect);
    EXPECT_TRUE(received.empty());
    loop.run_until_idle();
    reader.read(collect);
    reader.read(collect);
    loop.run_until_idle();

    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(*received[0], (std::vector<u8>{1, 2}));
    EXPECT_EQ(*received[1], (std::vector<u8>{3}));
    EXPECT_FALSE(received[2].has_value());
}

TEST(MemoryBodyReaderTest, CancelledTokenFailsRead) {
    ManualClock clock;
    EventLoop loop(clock);
    CancellationSource source;
    MemoryBodyReader reader(loop, {{1}}, source.token());
    source.cancel();

    std::optional<ResourceError> error;
    reader.read([&](ResourceResult<BodyChunk> result) {
        if (result.is_err()) {
            error = result.error();
        }
    });
    loop.run_until_idle();

    ASSERT_TRUE(error.has_value());
    EXPECT_TRUE(error->is_cancelled());
}

TEST(ResourceTypeTest, ParsesNames) {
    EXPECT_EQ(parse_resource_type("texture"), ResourceType::Texture);
    EXPECT_EQ(parse_resource_type("svg"), ResourceType::Svg);
    EXPECT_FALSE(parse_resource_type("video").has_value());
    EXPECT_EQ(to_string(ResourceType::Json), "json");
}

TEST(DecoderRegistryTest, BuiltinDecodersCoverBinaryAndSvg) {
    auto registry = DecoderRegistry::with_builtin_decoders();
    EXPECT_TRUE(registry.has_decoder(ResourceType::Binary));
    EXPECT_TRUE(registry.has_decoder(ResourceType::Svg));
    EXPECT_FALSE(registry.has_decoder(ResourceType::Texture));
    EXPECT_FALSE(registry.has_decoder(ResourceType::Audio));
}

TEST(DecoderRegistryTest, SvgWithoutRootIsTransient) {
    auto registry = DecoderRegistry::with_builtin_decoders();
    std::string id = "logo";
    std::string url = "https://assets.test/logo.svg";
    HttpHeaders headers;
    std::vector<u8> bytes{'<', 'p', '/', '>'};

    auto result = registry.decode(ResourceType::Svg, DecodeInput{id, url, headers, bytes});
    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().is_retryable());
}

TEST(DecoderRegistryTest, MissingDecoderIsConfigurationError) {
    auto registry = DecoderRegistry::with_builtin_decoders();
    registry.unregister_decoder(ResourceType::Binary);
    std::string id = "blob";
    std::string url = "https://assets.test/blob";
    HttpHeaders headers;
    std::vector<u8> bytes{1};

    auto result = registry.decode(ResourceType::Binary, DecodeInput{id, url, headers, bytes});
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ResourceErrorKind::Configuration);
    EXPECT_EQ(result.error().message, "Unsupported resource type: binary");
}
