#include <gate.pb.h>
#include <gatecore/error.h>
#include <gatecore/protocol/codec.h>
#include <gtest/gtest.h>

using namespace gatecore;

static message_header make_header(uint32_t type, std::string_view payload) {
    message_header header;
    header.message_id = 7;
    header.message_type = type;
    header.flags = message_flags::request;
    header.player_id = 0x0102030405060708ULL;
    header.timestamp = 1700000000123;
    header.sequence = 42;
    header.length = static_cast<uint32_t>(payload.size());
    return header;
}

TEST(codec, encode_layout_big_endian) {
    message_codec codec;
    std::error_code ec;
    const auto frame = codec.encode(make_header(0x0101, "abc"), "abc", ec);
    ASSERT_FALSE(ec);
    ASSERT_EQ(frame->readable(), message_header_size + 3);

    const auto* data = frame->begin_read();
    // magic "GWKS"
    EXPECT_EQ(data[0], 'G');
    EXPECT_EQ(data[1], 'W');
    EXPECT_EQ(data[2], 'K');
    EXPECT_EQ(data[3], 'S');
    // message_id = 7
    EXPECT_EQ(data[7], 7);
    // message_type = 0x0101
    EXPECT_EQ(data[10], 0x01);
    EXPECT_EQ(data[11], 0x01);
    // player_id 高位在前
    EXPECT_EQ(data[14], 0x01);
    EXPECT_EQ(data[21], 0x08);
    // length = 3
    EXPECT_EQ(data[37], 3);
    EXPECT_EQ(std::string_view(reinterpret_cast<const char*>(data + message_header_size), 3), "abc");
}

TEST(codec, decode_full_frame) {
    message_codec codec;
    std::error_code ec;
    const auto header = make_header(0x0205, "payload");
    const auto frame = codec.encode(header, "payload", ec);
    ASSERT_FALSE(ec);

    message msg;
    ASSERT_FALSE(codec.decode(static_cast<std::string_view>(*frame), msg));
    EXPECT_EQ(msg.header, header);
    EXPECT_EQ(msg.payload, "payload");
    EXPECT_EQ(message_category_of(msg.header.message_type), message_category::battle);
}

TEST(codec, encode_protobuf_payload) {
    message_codec codec;
    gate::auth_req req;
    req.set_token("p1");

    std::error_code ec;
    const auto frame = codec.encode(make_header(message_types::auth, {}), req, ec);
    ASSERT_FALSE(ec);

    message msg;
    ASSERT_FALSE(codec.decode(static_cast<std::string_view>(*frame), msg));
    EXPECT_EQ(msg.header.length, req.ByteSizeLong());

    gate::auth_req parsed;
    ASSERT_TRUE(parsed.ParseFromString(msg.payload));
    EXPECT_EQ(parsed.token(), "p1");
}

TEST(codec, empty_payload) {
    message_codec codec;
    std::error_code ec;
    const auto frame = codec.encode(make_header(message_types::heartbeat, {}), std::string_view{}, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(frame->readable(), message_header_size);

    message msg;
    ASSERT_FALSE(codec.decode(static_cast<std::string_view>(*frame), msg));
    EXPECT_EQ(msg.header.length, 0U);
    EXPECT_TRUE(msg.payload.empty());
}

TEST(codec, short_buffer_does_not_consume) {
    message_codec codec;
    std::error_code ec;
    const auto frame = codec.encode(make_header(0x0101, "abcdef"), "abcdef", ec);
    ASSERT_FALSE(ec);
    const auto bytes = static_cast<std::string_view>(*frame);

    // 只有半个消息头
    read_buffer half(bytes.substr(0, 20));
    message msg;
    EXPECT_EQ(codec.decode(half, msg), codec_errors::short_buffer);
    EXPECT_EQ(half.readable(), 20U);

    // 消息头完整，消息体不完整
    read_buffer partial(bytes.substr(0, message_header_size + 2));
    EXPECT_EQ(codec.decode(partial, msg), codec_errors::short_buffer);
    EXPECT_EQ(partial.readable(), message_header_size + 2);
}

TEST(codec, decode_two_frames_in_one_buffer) {
    message_codec codec;
    std::error_code ec;
    auto first = codec.encode(make_header(0x0101, "one"), "one", ec);
    auto second = codec.encode(make_header(0x0102, "two!"), "two!", ec);

    std::string joined(static_cast<std::string_view>(*first));
    joined += static_cast<std::string_view>(*second);

    read_buffer buf(joined);
    message msg;
    ASSERT_FALSE(codec.decode(buf, msg));
    EXPECT_EQ(msg.payload, "one");
    ASSERT_FALSE(codec.decode(buf, msg));
    EXPECT_EQ(msg.header.message_type, 0x0102U);
    EXPECT_EQ(msg.payload, "two!");
    EXPECT_EQ(buf.readable(), 0U);
}

TEST(codec, bad_magic) {
    message_codec codec;
    std::error_code ec;
    auto header = make_header(0x0101, "x");
    header.magic = 0x12345678;
    const auto frame = codec.encode(header, "x", ec);
    ASSERT_FALSE(ec);

    message msg;
    EXPECT_EQ(codec.decode(static_cast<std::string_view>(*frame), msg), codec_errors::bad_magic);
}

TEST(codec, oversized_length_rejected) {
    message_codec big(1024);
    message_codec small(16);
    std::error_code ec;
    const std::string payload(100, 'x');
    const auto frame = big.encode(make_header(0x0101, payload), payload, ec);
    ASSERT_FALSE(ec);

    // 声明的长度超过上限，不等消息体到达就报错
    read_buffer head_only(static_cast<std::string_view>(*frame).substr(0, message_header_size));
    message_header header;
    EXPECT_EQ(small.decode_header(head_only, header), codec_errors::bad_length);

    EXPECT_FALSE(small.encode(make_header(0x0101, payload), payload, ec));
    EXPECT_EQ(ec, codec_errors::payload_too_large);
}

TEST(codec, response_header_mirrors_request) {
    const auto request = make_header(0x0301, {});
    const auto response = make_response_header(request, 0x0302);
    EXPECT_EQ(response.message_id, request.message_id);
    EXPECT_EQ(response.sequence, request.sequence);
    EXPECT_EQ(response.message_type, 0x0302U);
    EXPECT_TRUE(response.has_flag(message_flags::response));
    EXPECT_FALSE(response.has_flag(message_flags::request));
    EXPECT_GT(response.timestamp, 0);
}

TEST(codec, error_response_payload) {
    const auto request = make_header(42, {});
    const auto msg = make_error_response(request, wire_errors::unhandled_message, "no handler");
    EXPECT_EQ(msg.header.message_id, 7U);
    EXPECT_EQ(msg.header.sequence, 42U);
    EXPECT_EQ(msg.header.message_type, message_types::error);
    EXPECT_TRUE(msg.header.has_flag(message_flags::response | message_flags::error));

    gate::error_ack ack;
    ASSERT_TRUE(ack.ParseFromString(msg.payload));
    EXPECT_EQ(ack.code(), wire_errors::unhandled_message);
    EXPECT_EQ(ack.error_type(), "UNHANDLED_MESSAGE");
    EXPECT_EQ(ack.message(), "no handler");
}

TEST(codec, message_category) {
    EXPECT_EQ(message_category_of(message_types::heartbeat), message_category::system);
    EXPECT_EQ(message_category_of(0x0100), message_category::player);
    EXPECT_EQ(message_category_of(0x08FF), message_category::query);
    EXPECT_EQ(message_category_of(0x0900), message_category::unknown);
    EXPECT_EQ(message_category_base(message_category::pet), 0x0300U);
    EXPECT_EQ(to_string_view(message_category::social), "social");
}

TEST(codec, encode_errors_use_codec_category) {
    message_codec codec(8);
    gate::error_ack ack;
    ack.set_message(std::string(64, 'x'));
    std::error_code ec;
    EXPECT_EQ(codec.encode(make_header(message_types::error, ""), ack, ec), nullptr);
    EXPECT_EQ(ec, codec_errors::payload_too_large);
    EXPECT_TRUE(ec.category() == get_codec_category());

    const std::error_code serialize_ec = codec_errors::serialize_failed;
    EXPECT_TRUE(serialize_ec.category() == get_codec_category());
    EXPECT_STREQ(serialize_ec.category().name(), "gatecore.codec");
    EXPECT_EQ(serialize_ec.message(), "payload serialize failed");
    EXPECT_NE(serialize_ec, router_errors::bad_payload);
}
