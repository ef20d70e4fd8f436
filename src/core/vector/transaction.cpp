// Copyright (c) 2018-2024 TU Delft 3D geoinformation group, Ravi Peters (3DGI),
// and Balazs Dukai (3DGI)

// This file is part of geobind.

// geobind is free software: you can redistribute it and/or modify it under
// the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version. geobind is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more
// details. You should have received a copy of the GNU General Public License
// along with geobind. If not, see <https://www.gnu.org/licenses/>.

// Author(s):
// Balazs Dukai


#include <geobind/common/errors.hpp>
#include <geobind/logger/logger.h>
#include <geobind/vector/transaction.hpp>

#include <fmt/format.h>

#include <utility>

namespace geobind {

  Transaction::~Transaction() { rollback_noexcept(); }

  Transaction::Transaction(Transaction&& other) noexcept
      : dataset_(std::exchange(other.dataset_, nullptr)),
        guard_(std::move(other.guard_)) {}

  Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
      rollback_noexcept();
      dataset_ = std::exchange(other.dataset_, nullptr);
      guard_ = std::move(other.guard_);
    }
    return *this;
  }

  GDALDatasetH Transaction::checked_dataset(const char* call) {
    if (dataset_ == nullptr) {
      throw BadArgumentError(
          fmt::format("{} on a transaction that already ended", call));
    }
    guard_.check("Transaction");
    // the transaction ends whatever the outcome
    return std::exchange(dataset_, nullptr);
  }

  void Transaction::commit() {
    GDALDatasetH dataset = checked_dataset("GDALDatasetCommitTransaction");
    OGRErr rv = GDALDatasetCommitTransaction(dataset);
    if (rv != OGRERR_NONE) {
      throw OgrError(rv, "GDALDatasetCommitTransaction");
    }
  }

  void Transaction::rollback() {
    GDALDatasetH dataset = checked_dataset("GDALDatasetRollbackTransaction");
    OGRErr rv = GDALDatasetRollbackTransaction(dataset);
    if (rv != OGRERR_NONE) {
      throw OgrError(rv, "GDALDatasetRollbackTransaction");
    }
  }

  void Transaction::rollback_noexcept() noexcept {
    if (dataset_ == nullptr) return;
    GDALDatasetH dataset = std::exchange(dataset_, nullptr);
    auto& logger = logger::Logger::get_logger();
    if (!guard_.is_alive()) {
      logger.warning("Transaction outlived its dataset, nothing to roll back");
      return;
    }
    OGRErr rv = GDALDatasetRollbackTransaction(dataset);
    if (rv != OGRERR_NONE) {
      logger.warning("Implicit rollback failed with OGR error {}", rv);
    }
  }

}  // namespace geobind
