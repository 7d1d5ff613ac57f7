#include "internal/access/access_control.hpp"

#include <cassert>
#include <iostream>

namespace {

using namespace timekeeper;

model::Match MatchOwnedBy(const std::string& admin) {
  model::Match m;
  m.match_id    = "3f2b8c1e-9d4a-4b7e-8f1a-2c3d4e5f6a7b";
  m.description = "Final";
  m.admin_id    = admin;
  return m;
}

void TestOnlyExactAdminControls() {
  auto match = MatchOwnedBy("A1");

  assert(access::IsAdmin("A1", match));
  assert(access::CanControlTimer("A1", match));

  assert(!access::IsAdmin("a1", match));
  assert(!access::CanControlTimer("a1", match));
  assert(!access::CanControlTimer("A1 ", match));
  assert(!access::CanControlTimer("B2", match));
  assert(!access::CanControlTimer("", match));
}

void TestEmptyAdminIsNobody() {
  auto match = MatchOwnedBy("");
  assert(!access::IsAdmin("", match));
  assert(!access::CanControlTimer("", match));
}

void TestEveryoneCanView() {
  auto match = MatchOwnedBy("A1");
  assert(access::CanViewMatch("A1", match));
  assert(access::CanViewMatch("spectator", match));
  assert(access::CanViewMatch("", match));
}

} // namespace

int main() {
  TestOnlyExactAdminControls();
  TestEmptyAdminIsNobody();
  TestEveryoneCanView();

  std::cout << "timekeeper_unit_access_control: pass\n";
  return 0;
}
