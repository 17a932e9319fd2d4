#include <disburse/schema/payout_batch.hpp>
#include <algorithm>

namespace disburse::schema {

payout_status_t derive_batch_status(const payout_batch_t& batch) {
  if (!batch.items.empty() &&
      std::ranges::all_of(batch.items, [](const auto& item) {
        return item.status == payout_status_t::paid;
      })) {
    return payout_status_t::paid;
  }
  auto touched = std::ranges::any_of(batch.items, [](const auto& item) {
    return item.attempts > 0 || item.status != payout_status_t::scheduled;
  });
  return touched ? payout_status_t::processing : payout_status_t::scheduled;
}

}  // namespace disburse::schema
