#include <tally/schema/key/archive_keys.hpp>
#include <tally/schema/key/builder.hpp>
#include <utility>

namespace tally::schema::key {

const std::string_view kArchiveTransactionPrefix{"ARC|TX|"};
const std::string_view kArchiveCountKey{"ARC|META|COUNT"};
const std::string_view kArchiveTipKey{"ARC|META|TIP"};

bytes_t make_archive_transaction_key(const transaction_index_t index) {
  auto key = builder{};
  key.write(kArchiveTransactionPrefix).write(index);
  return std::move(key.data);
}

}  // namespace tally::schema::key
