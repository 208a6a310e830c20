#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <type_traits>
#include <utility>
#include <vector>

namespace systock::util {

/*
  Collapse rows sharing a key; the last occurrence wins and the
  survivors keep their relative input order.
*/
template <typename Row, typename KeyFn, typename Less = std::less<>>
std::vector<Row> KeepLastByKey(std::vector<Row> rows, KeyFn key_of, Less less = {}) {
  using Key = std::decay_t<std::invoke_result_t<KeyFn&, const Row&>>;

  std::map<Key, std::size_t, Less> last_index(less);
  for (std::size_t i = 0; i < rows.size(); ++i) {
    last_index.insert_or_assign(key_of(rows[i]), i);
  }

  std::vector<bool> keep(rows.size(), false);
  for (const auto& [key, index] : last_index) {
    keep[index] = true;
  }

  std::vector<Row> out;
  out.reserve(last_index.size());
  for (std::size_t i = 0; i < rows.size(); ++i) {
    if (keep[i]) {
      out.push_back(std::move(rows[i]));
    }
  }
  return out;
}

} // namespace systock::util
