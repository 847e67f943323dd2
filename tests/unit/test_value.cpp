#include <busq++/value.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <string>

using namespace Busq;

namespace {

Value sample_dict() {
    Value dict = Value::new_dict();
    dict.set("Name", Value::from_string("Mock iPhone")).unwrap();
    dict.set("Build", Value::from_uint(21)).unwrap();
    dict.set("Battery", Value::from_real(0.5)).unwrap();
    dict.set("Charging", Value::from_bool(true)).unwrap();
    dict.set("Blob", Value::from_data(std::vector<uint8_t>{0x00, 0xFF, 0x10})).unwrap();
    dict.set("Seen", Value::from_date(Date{700000000, 0})).unwrap();

    Value list = Value::new_array();
    list.append(Value::from_string("one")).unwrap();
    list.append(Value::from_uint(2)).unwrap();
    dict.set("List", std::move(list)).unwrap();
    return dict;
}

} // namespace

TEST(ValueTest, BinaryRoundTripPreservesEveryType) {
    Value original = sample_dict();
    auto  bytes    = original.encode(Format::Binary).expect("encode");
    ASSERT_TRUE(Value::is_binary(bytes.data(), bytes.size()));

    auto decoded = Value::decode(bytes, Format::Binary).expect("decode");
    EXPECT_TRUE(decoded == original);
    EXPECT_EQ(decoded["Seen"].as_date(), (std::optional<Date>(Date{700000000, 0})));
}

TEST(ValueTest, BinaryDateKeepsSubsecondPart) {
    Value date  = Value::from_date(Date{700000000, 250000});
    auto  bytes = date.encode(Format::Binary).expect("encode");
    auto  back  = Value::decode(bytes, Format::Binary).expect("decode");
    EXPECT_EQ(back.as_date(), (std::optional<Date>(Date{700000000, 250000})));
}

TEST(ValueTest, XmlRoundTripPreservesEveryType) {
    Value original = sample_dict();
    auto  xml      = original.to_xml().expect("to_xml");
    EXPECT_NE(xml.find("<key>Name</key>"), std::string::npos);

    auto decoded = Value::decode(xml, Format::Xml).expect("decode");
    EXPECT_TRUE(decoded == original);
}

TEST(ValueTest, DecodeAutoPicksFormatFromSignature) {
    Value original = sample_dict();

    auto binary = original.encode(Format::Binary).expect("binary");
    auto xml    = original.encode(Format::Xml).expect("xml");
    EXPECT_EQ(std::string(binary.begin(), binary.begin() + 6), "bplist");
    EXPECT_FALSE(Value::is_binary(xml.data(), xml.size()));

    EXPECT_TRUE(Value::decode_auto(binary).expect("binary") == original);
    EXPECT_TRUE(Value::decode_auto(xml).expect("xml") == original);
}

TEST(ValueTest, MalformedInputIsFormatError) {
    std::string junk = "<plist><dict><key>unterminated";
    auto        r    = Value::decode(junk, Format::Xml);
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.unwrap_err().is(PlistError::FormatError));

    auto empty = Value::decode_auto(nullptr, 0);
    ASSERT_TRUE(empty.is_err());
    EXPECT_TRUE(empty.unwrap_err().is(PlistError::FormatError));
}

// JSON has no date or data; compare through the accessors because integers
// come back in whatever width the parser picks
TEST(ValueTest, JsonRoundTripForPlainTrees) {
    Value original = Value::new_dict();
    original.set("Name", Value::from_string("Mock iPhone")).unwrap();
    original.set("Build", Value::from_uint(21)).unwrap();
    original.set("Battery", Value::from_real(0.5)).unwrap();
    original.set("Charging", Value::from_bool(true)).unwrap();
    Value list = Value::new_array();
    list.append(Value::from_string("one")).unwrap();
    list.append(Value::from_uint(2)).unwrap();
    original.set("List", std::move(list)).unwrap();

    auto json = original.encode(Format::Json).expect("encode");
    std::string text(json.begin(), json.end());
    EXPECT_NE(text.find("\"Name\""), std::string::npos);

    auto decoded = Value::decode(json, Format::Json).expect("decode");
    EXPECT_EQ(decoded.type(), ValueType::Dictionary);
    EXPECT_EQ(decoded["Name"].as_string(), std::optional<std::string>("Mock iPhone"));
    EXPECT_EQ(decoded["Build"].as_uint(), std::optional<uint64_t>(21));
    EXPECT_EQ(decoded["Battery"].as_real(), std::optional<double>(0.5));
    EXPECT_EQ(decoded["Charging"].as_bool(), std::optional<bool>(true));
    ASSERT_EQ(decoded["List"].size(), 2u);
    EXPECT_EQ(decoded["List"][0].as_string(), std::optional<std::string>("one"));
    EXPECT_EQ(decoded["List"][1].as_uint(), std::optional<uint64_t>(2));
}

TEST(ValueTest, MalformedJsonIsFormatError) {
    auto r = Value::decode(std::string("{\"Name\": "), Format::Json);
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.unwrap_err().is(PlistError::FormatError));
}

TEST(ValueTest, FromMemoryDetectsEachFormat) {
    Value original = Value::new_dict();
    original.set("Name", Value::from_string("Mock iPhone")).unwrap();
    original.set("Charging", Value::from_bool(false)).unwrap();

    for (Format format : {Format::Binary, Format::Xml, Format::Json}) {
        auto bytes = original.encode(format).expect("encode");
        auto back  = Value::from_memory(bytes.data(), bytes.size());
        ASSERT_TRUE(back.is_ok()) << static_cast<int>(format);
        EXPECT_EQ(back.unwrap()["Name"].as_string(), std::optional<std::string>("Mock iPhone"));
        EXPECT_EQ(back.unwrap()["Charging"].as_bool(), std::optional<bool>(false));
    }

    std::string junk = "{\"Name\": ";
    auto        bad  = Value::from_memory(reinterpret_cast<const uint8_t*>(junk.data()), junk.size());
    ASSERT_TRUE(bad.is_err());
    EXPECT_TRUE(bad.unwrap_err().is(PlistError::FormatError));
    EXPECT_TRUE(Value::from_memory(nullptr, 0).unwrap_err().is(PlistError::FormatError));
}

TEST(ValueTest, DictionaryLookupAndAbsence) {
    Value dict = sample_dict();

    EXPECT_EQ(dict["Name"].as_string(), std::optional<std::string>("Mock iPhone"));
    EXPECT_EQ(dict["Build"].as_uint(), std::optional<uint64_t>(21));
    EXPECT_TRUE(dict.contains("List"));

    ValueRef missing = dict["NoSuchKey"];
    EXPECT_TRUE(missing.is_none());
    EXPECT_EQ(missing.type(), ValueType::None);
    EXPECT_FALSE(dict.contains("NoSuchKey"));

    // Chained lookups through a missing key stay absent
    EXPECT_FALSE(dict["NoSuchKey"]["Deeper"][3].as_string().has_value());
}

TEST(ValueTest, TypedAccessorsRequireMatchingTag) {
    Value dict = sample_dict();
    EXPECT_FALSE(dict["Name"].as_uint().has_value());
    EXPECT_FALSE(dict["Build"].as_string().has_value());
    EXPECT_FALSE(dict["Charging"].as_data().has_value());
    EXPECT_EQ(dict["Charging"].as_bool(), std::optional<bool>(true));
    EXPECT_DOUBLE_EQ(*dict["Battery"].as_real(), 0.5);
}

TEST(ValueTest, ArrayIndexingAndMutation) {
    Value list = Value::from_strings({"a", "b", "c"});
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[1].as_string(), std::optional<std::string>("b"));
    EXPECT_TRUE(list[3].is_none());

    ASSERT_TRUE(list.insert(0, Value::from_string("z")).is_ok());
    ASSERT_TRUE(list.remove_at(2).is_ok());
    ASSERT_TRUE(list.set_at(2, Value::from_string("y")).is_ok());
    EXPECT_EQ(list[0].as_string(), std::optional<std::string>("z"));
    EXPECT_EQ(list[1].as_string(), std::optional<std::string>("a"));
    EXPECT_EQ(list[2].as_string(), std::optional<std::string>("y"));

    auto out_of_range = list.set_at(9, Value::from_string("x"));
    ASSERT_TRUE(out_of_range.is_err());
    EXPECT_TRUE(out_of_range.unwrap_err().is(PlistError::InvalidArgument));
}

TEST(ValueTest, ContainerMutationOnWrongTypeFails) {
    Value text = Value::from_string("leaf");
    EXPECT_TRUE(text.set("k", Value::from_bool(false)).is_err());
    EXPECT_TRUE(text.append(Value::from_bool(false)).is_err());

    Value dict = Value::new_dict();
    EXPECT_TRUE(dict.set("k", Value()).is_err());
    EXPECT_TRUE(dict.remove("absent").is_err());
}

TEST(ValueTest, ChildrenKnowTheirParentAndKey) {
    Value    dict = sample_dict();
    ValueRef list = dict["List"];
    EXPECT_TRUE(list.parent() == dict);
    EXPECT_EQ(list.key(), std::optional<std::string>("List"));
    EXPECT_FALSE(list[0].key().has_value());
}

TEST(ValueTest, EqualityIgnoresDictionaryOrder) {
    Value a = Value::new_dict();
    a.set("x", Value::from_uint(1)).unwrap();
    a.set("y", Value::from_uint(2)).unwrap();
    Value b = Value::new_dict();
    b.set("y", Value::from_uint(2)).unwrap();
    b.set("x", Value::from_uint(1)).unwrap();
    EXPECT_TRUE(a == b);

    b.set("x", Value::from_uint(3)).unwrap();
    EXPECT_TRUE(a != b);
}

TEST(ValueTest, CopyIsDeepAndIndependent) {
    Value original = sample_dict();
    Value clone    = original.copy();
    clone.set("Name", Value::from_string("Other")).unwrap();
    EXPECT_EQ(original["Name"].as_string(), std::optional<std::string>("Mock iPhone"));
    EXPECT_EQ(clone["Name"].as_string(), std::optional<std::string>("Other"));
}

TEST(ValueTest, IteratorWalksDictionaryEntries) {
    Value dict = Value::new_dict();
    dict.set("a", Value::from_uint(1)).unwrap();
    dict.set("b", Value::from_uint(2)).unwrap();

    uint64_t sum   = 0;
    size_t   count = 0;
    auto     it    = dict.iter();
    while (auto entry = it.next()) {
        ASSERT_TRUE(entry->key.has_value());
        sum += entry->value.as_uint().value_or(0);
        ++count;
    }
    EXPECT_EQ(count, 2u);
    EXPECT_EQ(sum, 3u);
    EXPECT_EQ(dict.keys().size(), 2u);
}

TEST(ValueTest, DateNormalizesMicroseconds) {
    Date d = Date::normalized(10, -1);
    EXPECT_EQ(d.seconds, 9);
    EXPECT_EQ(d.microseconds, 999999);

    Date carry = Date::normalized(10, 2500000);
    EXPECT_EQ(carry.seconds, 12);
    EXPECT_EQ(carry.microseconds, 500000);

    auto now = std::chrono::system_clock::now();
    Date back = Date::from_time_point(now);
    auto diff = std::chrono::duration_cast<std::chrono::microseconds>(back.to_time_point() - now).count();
    EXPECT_LE(std::abs(diff), 1);
}

TEST(ValueTest, JsonOutputForSimpleValues) {
    Value dict = Value::new_dict();
    dict.set("ok", Value::from_bool(true)).unwrap();
    auto json = dict.to_json().expect("to_json");
    EXPECT_NE(json.find("\"ok\""), std::string::npos);
    EXPECT_NE(json.find("true"), std::string::npos);
}
