#include "internal/util/uuid.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

namespace {

bool Throws(const std::string& value) {
  try {
    (void)voicecode::util::FromString(value);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestGeneratedIdsAreCanonicalVersion4() {
  std::set<std::string> seen;
  for (int i = 0; i < 256; ++i) {
    const auto id = voicecode::util::GenerateUUIDString();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    assert(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
    assert(voicecode::util::Canonicalize(id) == id);
    seen.insert(id);
  }
  assert(seen.size() == 256);
}

void TestCanonicalizeAcceptsCaseAndMissingDashes() {
  const std::string canonical = "123e4567-e89b-42d3-a456-426614174000";
  assert(voicecode::util::Canonicalize("123E4567-E89B-42D3-A456-426614174000") == canonical);
  assert(voicecode::util::Canonicalize("123e4567e89b42d3a456426614174000") == canonical);
}

void TestMalformedIdsAreRejected() {
  assert(Throws(""));
  assert(Throws("not-a-uuid"));
  assert(Throws("123e4567-e89b-42d3-a456-42661417400g"));
  assert(Throws("123e4567+e89b-42d3-a456-426614174000"));
  assert(Throws("123e4567-e89b-42d3-a456-4266141740000"));
}

} // namespace

int main() {
  TestGeneratedIdsAreCanonicalVersion4();
  TestCanonicalizeAcceptsCaseAndMissingDashes();
  TestMalformedIdsAreRejected();

  std::cout << "voicecode_unit_uuid: pass\n";
  return 0;
}
