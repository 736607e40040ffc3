#include <revreg/schema/revocation_status_list.hpp>

namespace revreg::schema {

std::vector<uint32_t> make_revocation_list(
    const revocation_status_list_t& status_list,
    const uint32_t size) {
  auto list = std::vector<uint32_t>(size, 0);
  for (const auto index : status_list.revoked) {
    if (index < size) {
      list[index] = 1;
    }
  }
  return list;
}

}  // namespace revreg::schema
