#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "json/JsonCodec.hpp"

using json = nlohmann::json;
using namespace toolkit;
using Reason = JsonDecodeError::Reason;

namespace {

    struct Foo {
        std::string foo;
    };

    void to_json(json& j, const Foo& f) { j = json{{"foo", f.foo}}; }
    void from_json(const json& j, Foo& f) { j.at("foo").get_to(f.foo); }

    struct Account {
        std::string name;
        int age = 0;
        std::vector<std::string> tags;
    };

    void to_json(json& j, const Account& a) { j = json{{"name", a.name}, {"age", a.age}, {"tags", a.tags}}; }
    void from_json(const json& j, Account& a) {
        j.at("name").get_to(a.name);
        j.at("age").get_to(a.age);
        j.at("tags").get_to(a.tags);
    }

    struct Person {
        int age = 0;
    };

    void to_json(json& j, const Person& p) { j = json{{"age", p.age}}; }
    void from_json(const json& j, Person& p) { j.at("age").get_to(p.age); }

    struct Scores {
        std::vector<int> tags;
    };

    void to_json(json& j, const Scores& s) { j = json{{"tags", s.tags}}; }
    void from_json(const json& j, Scores& s) { j.at("tags").get_to(s.tags); }

    struct Item {
        std::string sku;
        int qty = 0;
    };

    void to_json(json& j, const Item& i) { j = json{{"sku", i.sku}, {"qty", i.qty}}; }
    void from_json(const json& j, Item& i) {
        j.at("sku").get_to(i.sku);
        j.at("qty").get_to(i.qty);
    }

    struct Order {
        std::vector<Item> items;
    };

    void to_json(json& j, const Order& o) { j = json{{"items", o.items}}; }
    void from_json(const json& j, Order& o) { j.at("items").get_to(o.items); }

    template <typename T>
    JsonDecodeError decodeFailure(const std::string& body, T& target,
                                  std::uint64_t maxBytes = 0, bool allowUnknown = false) {
        try {
            JsonCodec::decode(body, maxBytes, allowUnknown, target);
        } catch (const JsonDecodeError& e) {
            return e;
        }
        ADD_FAILURE() << "decoding " << body << " did not fail";
        return JsonDecodeError(Reason::Other, "no error");
    }

    // Writer whose body sink always fails
    class BrokenWriter : public http::ResponseWriter {
    public:
        http::Headers& headers() override { return headers_; }
        void writeHeader(int status) override { status_ = status; }
        bool write(std::string_view) override { return false; }

        int status_ = 0;
        http::Headers headers_;
    };

}

TEST(JsonDecodeTest, DecodesMatchingObject) {
    Foo target;
    JsonCodec::decode(R"({"foo": "bar"})", 0, false, target);
    EXPECT_EQ(target.foo, "bar");
}

TEST(JsonDecodeTest, DecodesNestedStruct) {
    Account account;
    JsonCodec::decode(R"({"name":"ada","age":36,"tags":["x","y"]})", 0, false, account);
    EXPECT_EQ(account.name, "ada");
    EXPECT_EQ(account.age, 36);
    EXPECT_EQ(account.tags, (std::vector<std::string>{"x", "y"}));
}

TEST(JsonDecodeTest, MissingFieldsKeepTargetValues) {
    Account account;
    account.name = "preset";
    account.age = 7;
    JsonCodec::decode(R"({"age": null, "tags": []})", 0, false, account);
    EXPECT_EQ(account.name, "preset");
    EXPECT_EQ(account.age, 7);
}

TEST(JsonDecodeTest, WrongFieldTypeNamesField) {
    Foo target;
    JsonDecodeError e = decodeFailure(R"({"foo": 99})", target);
    EXPECT_EQ(e.reason(), Reason::TypeMismatch);
    EXPECT_EQ(e.field(), "foo");
    EXPECT_STREQ(e.what(), "request body contains incorrect JSON type for field \"foo\"");
    EXPECT_EQ(e.kind(), ErrorKind::MalformedInput);
}

TEST(JsonDecodeTest, WrongFieldTypeOffsetIsAfterTheValue) {
    Foo target;
    JsonDecodeError e = decodeFailure(R"({"foo": 99})", target);
    EXPECT_EQ(e.offset(), 10u);
}

TEST(JsonDecodeTest, IntegerOutOfRangeIsTypeMismatch) {
    Person person;
    person.age = 41;
    JsonDecodeError e = decodeFailure(R"({"age": 99999999999})", person);
    EXPECT_EQ(e.reason(), Reason::TypeMismatch);
    EXPECT_EQ(e.field(), "age");
    EXPECT_STREQ(e.what(), "request body contains incorrect JSON type for field \"age\"");
    EXPECT_EQ(person.age, 41);
}

TEST(JsonDecodeTest, IntegerOutOfRangeOffsetPointsAtField) {
    Account account;
    JsonDecodeError e = decodeFailure(R"({"name":"x","age": 99999999999,"tags":[]})", account);
    EXPECT_EQ(e.field(), "age");
    EXPECT_EQ(e.offset(), 30u);
}

TEST(JsonDecodeTest, FractionIntoIntegerFieldIsTypeMismatch) {
    Person person;
    JsonDecodeError e = decodeFailure(R"({"age": 3.5})", person);
    EXPECT_EQ(e.reason(), Reason::TypeMismatch);
    EXPECT_EQ(e.field(), "age");
}

TEST(JsonDecodeTest, WrongElementTypeNamesArrayField) {
    Scores scores;
    JsonDecodeError e = decodeFailure(R"({"tags": ["x"]})", scores);
    EXPECT_EQ(e.reason(), Reason::TypeMismatch);
    EXPECT_EQ(e.field(), "tags");
    EXPECT_EQ(e.offset(), 14u);
    EXPECT_STREQ(e.what(), "request body contains incorrect JSON type for field \"tags\"");
}

TEST(JsonDecodeTest, UnknownKeyInsideArrayElementRejected) {
    Order order;
    JsonDecodeError e = decodeFailure(R"({"items":[{"sku":"a","qty":1,"color":"red"}]})", order);
    EXPECT_EQ(e.reason(), Reason::UnknownField);
    EXPECT_EQ(e.field(), "items.color");
    EXPECT_TRUE(order.items.empty());
}

TEST(JsonDecodeTest, UnknownKeyInsideArrayElementAllowedWhenConfigured) {
    Order order;
    JsonCodec::decode(R"({"items":[{"sku":"a","qty":1,"color":"red"}]})", 0, true, order);
    ASSERT_EQ(order.items.size(), 1u);
    EXPECT_EQ(order.items[0].sku, "a");
    EXPECT_EQ(order.items[0].qty, 1);
}

TEST(JsonDecodeTest, WrongTopLevelTypeReportsOffset) {
    Foo target;
    JsonDecodeError e = decodeFailure("[1,2]", target);
    EXPECT_EQ(e.reason(), Reason::TypeMismatch);
    EXPECT_TRUE(e.field().empty());
    EXPECT_NE(std::string(e.what()).find("at character"), std::string::npos);
}

TEST(JsonDecodeTest, SyntaxErrorReportsOffset) {
    Foo target;
    JsonDecodeError e = decodeFailure(R"({"foo":})", target);
    EXPECT_EQ(e.reason(), Reason::Syntax);
    EXPECT_GT(e.offset(), 0u);
    EXPECT_NE(std::string(e.what()).find("request body contains badly formed JSON: at character"),
              std::string::npos);
}

TEST(JsonDecodeTest, TruncatedBody) {
    Foo target;
    JsonDecodeError e = decodeFailure(R"({"foo":"bar")", target);
    EXPECT_EQ(e.reason(), Reason::Truncated);
    EXPECT_STREQ(e.what(), "request body contains badly formed JSON at some point within");
}

TEST(JsonDecodeTest, EmptyBody) {
    Foo target;
    for (const std::string body : {"", "   \n\t"}) {
        JsonDecodeError e = decodeFailure(body, target);
        EXPECT_EQ(e.reason(), Reason::EmptyBody);
        EXPECT_EQ(e.kind(), ErrorKind::EmptyInput);
        EXPECT_STREQ(e.what(), "request body cannot be empty");
    }
}

TEST(JsonDecodeTest, UnknownFieldRejectedByDefault) {
    Foo target;
    JsonDecodeError e = decodeFailure(R"({"foo":"bar","extra":1})", target);
    EXPECT_EQ(e.reason(), Reason::UnknownField);
    EXPECT_EQ(e.field(), "extra");
    EXPECT_STREQ(e.what(), "request body contains unknown key: \"extra\"");
}

TEST(JsonDecodeTest, UnknownFieldAllowedWhenConfigured) {
    Foo target;
    EXPECT_NO_THROW(JsonCodec::decode(R"({"foo":"bar","extra":1})", 0, true, target));
    EXPECT_EQ(target.foo, "bar");
}

TEST(JsonDecodeTest, BodyAboveLimit) {
    Foo target;
    JsonDecodeError e = decodeFailure(R"({"foo":"a long enough value"})", target, 10);
    EXPECT_EQ(e.reason(), Reason::TooLarge);
    EXPECT_EQ(e.kind(), ErrorKind::SizeExceeded);
    EXPECT_STREQ(e.what(), "maximum allowed request body size is 10 bytes");
}

TEST(JsonDecodeTest, BodyAtLimitIsAccepted) {
    Foo target;
    const std::string body = R"({"foo":"x"})";
    EXPECT_NO_THROW(JsonCodec::decode(body, body.size(), false, target));
}

TEST(JsonDecodeTest, SecondValueRejected) {
    Foo target;
    JsonDecodeError e = decodeFailure(R"({"foo":"a"}{"foo":"b"})", target);
    EXPECT_EQ(e.reason(), Reason::MultipleValues);
    EXPECT_STREQ(e.what(), "request body must only contain one JSON value");
}

TEST(JsonDecodeTest, TrailingWhitespaceIsFine) {
    Foo target;
    EXPECT_NO_THROW(JsonCodec::decode("{\"foo\":\"a\"}\r\n  ", 0, false, target));
}

TEST(JsonDecodeTest, OpenTargetAcceptsAnyObject) {
    json target;
    JsonCodec::decode(R"({"anything": [1, 2], "else": {"x": true}})", 0, false, target);
    EXPECT_EQ(target["anything"].size(), 2u);
    EXPECT_TRUE(target["else"]["x"].get<bool>());
}

TEST(JsonEncodeTest, WritesStatusHeaderAndBody) {
    http::Response res;
    JsonResponse payload;
    payload.message = "ok";

    JsonCodec::encode(res, 201, payload);

    EXPECT_EQ(res.status, 201);
    EXPECT_EQ(res.header("Content-Type"), "application/json");
    json body = json::parse(res.body);
    EXPECT_FALSE(body["error"].get<bool>());
    EXPECT_EQ(body["message"], "ok");
    EXPECT_FALSE(body.contains("data"));
}

TEST(JsonEncodeTest, OnlyFirstHeaderSetApplied) {
    http::Response res;
    JsonWriteOptions options;
    options.headers.push_back({{"X-First", "1"}});
    options.headers.push_back({{"X-Second", "2"}});

    JsonCodec::encode(res, 200, json{{"k", "v"}}, options);

    EXPECT_EQ(res.header("X-First"), "1");
    EXPECT_EQ(res.header("X-Second"), "");
}

TEST(JsonEncodeTest, FailingWriterIsIoError) {
    BrokenWriter w;
    try {
        JsonCodec::encode(w, 200, json{{"k", "v"}});
        FAIL() << "Expected ToolkitError";
    } catch (const ToolkitError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }
}

TEST(JsonEncodeTest, InvalidUtf8IsEncodingError) {
    http::Response res;
    try {
        JsonCodec::encode(res, 200, json{{"bad", std::string("\xFF\xFE")}});
        FAIL() << "Expected ToolkitError";
    } catch (const ToolkitError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Encoding);
    }
    EXPECT_TRUE(res.body.empty());
}

TEST(JsonEncodeErrorTest, DefaultsToBadRequest) {
    http::Response res;
    JsonCodec::encodeError(res, std::runtime_error("boom"));

    EXPECT_EQ(res.status, 400);
    json body = json::parse(res.body);
    EXPECT_TRUE(body["error"].get<bool>());
    EXPECT_EQ(body["message"], "boom");
}

TEST(JsonEncodeErrorTest, CustomStatus) {
    http::Response res;
    ErrorJsonOptions options;
    options.status = 503;
    JsonCodec::encodeError(res, std::runtime_error("later"), options);

    EXPECT_EQ(res.status, 503);
}
