#include "pml/component/component.hpp"
#include "pml/core/error.hpp"
#include "pml/core/identity.hpp"
#include "pml/element/element.hpp"

#include "test_main.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

using pml::core::errc;
using pml::core::identity_registry;
using pml::core::make_error_code;

void test_claim_is_idempotent_per_writer() {
  auto& reg = identity_registry();
  TEST_EXPECT_OK(reg.claim("test.key/v1", "writer-a"));
  TEST_EXPECT_OK(reg.claim("test.key/v1", "writer-a"));
  TEST_EXPECT_EQ(reg.claim("test.key/v1", "writer-b"), make_error_code(errc::already_registered));
  TEST_EXPECT_EQ(reg.owner("test.key/v1"), "writer-a");
  TEST_EXPECT(reg.contains("test.key/v1"));
  TEST_EXPECT(!reg.contains("test.other/v1"));
  TEST_EXPECT_EQ(reg.owner("test.other/v1"), "");
}

void test_claim_rejects_empty() {
  auto& reg = identity_registry();
  TEST_EXPECT_EQ(reg.claim("", "w"), make_error_code(errc::invalid_argument));
  TEST_EXPECT_EQ(reg.claim("k", ""), make_error_code(errc::invalid_argument));
}

void test_registry_is_process_wide() {
  auto* a = pml_identity_registry_v1();
  auto* b = pml_identity_registry_v1();
  TEST_EXPECT(a != nullptr);
  TEST_EXPECT(a == b);
  TEST_EXPECT(&identity_registry() == &identity_registry());
}

void test_concurrent_claims_have_one_owner() {
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([i, &winners] {
      if (!identity_registry().claim("test.race/v1", "writer-" + std::to_string(i))) {
        ++winners;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  TEST_EXPECT_EQ(winners.load(), 1);
  TEST_EXPECT(identity_registry().owner("test.race/v1").rfind("writer-", 0) == 0);
}

void test_element_brand_claimed_on_construction() {
  auto el = pml::fragment({"x"});
  TEST_EXPECT(pml::is_branded_element(el.get()));
  TEST_EXPECT_EQ(identity_registry().owner(pml::core::kElementBrand), "pml-1");
  TEST_EXPECT_EQ(std::string(el->brand()), std::string(pml::core::kElementBrand));
}

void test_brand_compared_by_value() {
  // 不同地址、相同内容的 brand 同样匹配
  const std::string copy(pml::core::kElementBrand);
  TEST_EXPECT(pml::core::brand_matches(copy.c_str(), pml::core::kElementBrand));
  TEST_EXPECT(!pml::core::brand_matches("pml.element/v2", pml::core::kElementBrand));
  TEST_EXPECT(!pml::core::brand_matches(nullptr, pml::core::kElementBrand));
}

}  // namespace

int main() {
  test_claim_is_idempotent_per_writer();
  test_claim_rejects_empty();
  test_registry_is_process_wide();
  test_concurrent_claims_have_one_owner();
  test_element_brand_claimed_on_construction();
  test_brand_compared_by_value();
  return ::pml::tests::run_and_report();
}
