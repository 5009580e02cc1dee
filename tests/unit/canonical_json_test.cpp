#include <cassert>
#include <iostream>
#include <limits>
#include <string>

#include "internal/entity/canonical_json.hpp"
#include "internal/entity/entity_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace {

using engram::entity::CanonicalJson;
using engram::entity::ParseJson;

template <typename Fn>
bool ThrowsValidation(Fn&& fn) {
  try {
    fn();
  } catch (const engram::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestKeysAreSortedAndCompact() {
  auto value = ParseJson(R"({ "b": 1, "a": {"z": true, "y": null}, "c": [3, "x"] })");
  assert(CanonicalJson(value) == R"({"a":{"y":null,"z":true},"b":1,"c":[3,"x"]})");
}

void TestNumbers() {
  assert(CanonicalJson(ParseJson("42")) == "42");
  assert(CanonicalJson(ParseJson("-7.0")) == "-7");
  assert(CanonicalJson(ParseJson("0.5")) == "0.5");
  assert(CanonicalJson(ParseJson("1e3")) == "1000");

  google::protobuf::Value inf;
  inf.set_number_value(std::numeric_limits<double>::infinity());
  assert(ThrowsValidation([&] { (void)CanonicalJson(inf); }));
}

void TestStringEscapes() {
  google::protobuf::Value s;
  s.set_string_value("quote\" slash\\ nl\n bell\x07 snow\xE2\x98\x83");
  assert(CanonicalJson(s) == "\"quote\\\" slash\\\\ nl\\n bell\\u0007 snow\xE2\x98\x83\"");
}

void TestParseRejectsMalformedJson() {
  assert(ThrowsValidation([] { (void)ParseJson("{\"a\":"); }));
}

void TestEquivalentDocumentsAreSame() {
  assert(engram::entity::SameValue(ParseJson(R"({"a":1,"b":[1,2]})"), ParseJson(R"({"b":[1.0,2],"a":1})")));
  assert(!engram::entity::SameValue(ParseJson(R"({"a":[1,2]})"), ParseJson(R"({"a":[2,1]})")));
}

void TestEntityEncodingIsCanonical() {
  auto entity = engram::entity::MakeEntity("task", "t1", "alice");
  entity.set_created_at_ms(10);
  entity.set_updated_at_ms(20);
  engram::entity::SetStringField(entity, "title", "Write docs");
  engram::entity::SetNumberField(entity, "estimate", 3);

  const auto bytes = engram::entity::EncodeEntity(entity);
  assert(bytes ==
         R"({"agent":"alice","archived":false,"created_at_ms":10,"entity_id":"t1","entity_type":"task","fields":{"estimate":3,"title":"Write docs"},"updated_at_ms":20})");
  assert(engram::entity::HashEntity(entity) == engram::util::Sha256Hex(bytes));

  auto decoded = engram::entity::DecodeEntity(bytes);
  assert(decoded.key().entity_id() == "t1");
  assert(decoded.agent() == "alice");
  assert(engram::entity::GetStringField(decoded, "title") == "Write docs");
  assert(engram::entity::GetNumberField(decoded, "estimate") == 3);
  assert(engram::entity::EncodeEntity(decoded) == bytes);
}

void TestFieldOrderDoesNotChangeHash() {
  auto a = engram::entity::MakeEntity("knowledge", "k1", "bob");
  engram::entity::SetStringField(a, "title", "T");
  engram::entity::SetStringField(a, "content", "C");

  auto b = engram::entity::MakeEntity("knowledge", "k1", "bob");
  engram::entity::SetStringField(b, "content", "C");
  engram::entity::SetStringField(b, "title", "T");

  assert(engram::entity::HashEntity(a) == engram::entity::HashEntity(b));

  engram::entity::SetStringField(b, "content", "D");
  assert(engram::entity::HashEntity(a) != engram::entity::HashEntity(b));
}

void TestDecodeRejectsForeignDocuments() {
  assert(ThrowsValidation([] { (void)engram::entity::DecodeEntity("[1,2]"); }));
  assert(ThrowsValidation([] { (void)engram::entity::DecodeEntity(R"({"entity_type":"task"})"); }));
  assert(ThrowsValidation([] {
    (void)engram::entity::DecodeEntity(
        R"({"agent":"a","archived":false,"created_at_ms":1,"entity_id":"x","entity_type":"task","extra":1,"fields":{},"updated_at_ms":1})");
  }));

  // timestamps must fit an unsigned 64-bit millisecond count
  for (const char* ms : {"-1", "1.5", "1e300", "18446744073709551616"}) {
    const std::string doc = std::string(R"({"agent":"a","archived":false,"created_at_ms":)") + ms +
                            R"(,"entity_id":"x","entity_type":"task","fields":{},"updated_at_ms":1})";
    assert(ThrowsValidation([&] { (void)engram::entity::DecodeEntity(doc); }));
  }
}

void TestFieldAccessorsFallBack() {
  auto entity = engram::entity::MakeEntity("task", "t1", "alice");
  engram::entity::SetNumberField(entity, "priority", 2);
  assert(engram::entity::GetStringField(entity, "priority", "none") == "none");
  assert(engram::entity::GetStringField(entity, "missing") == "");
  assert(!engram::entity::GetBoolField(entity, "missing"));
  engram::entity::SetBoolField(entity, "done", true);
  assert(engram::entity::GetBoolField(entity, "done"));
}

} // namespace

int main() {
  TestKeysAreSortedAndCompact();
  TestNumbers();
  TestStringEscapes();
  TestParseRejectsMalformedJson();
  TestEquivalentDocumentsAreSame();
  TestEntityEncodingIsCanonical();
  TestFieldOrderDoesNotChangeHash();
  TestDecodeRejectsForeignDocuments();
  TestFieldAccessorsFallBack();

  std::cout << "engram_unit_canonical_json: pass\n";
  return 0;
}
