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


#pragma once

#include <utility>

#include <gdal.h>

#include <geobind/common/borrow.hpp>

namespace geobind {

  class Dataset;

  /**
   * @brief A transaction on a dataset, started by Dataset::start_transaction.
   *
   * Ends with commit() or rollback(). A transaction destroyed while still
   * active is rolled back, a failure of that rollback is logged.
   */
  class Transaction {
   public:
    ~Transaction();
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) noexcept;
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();
    void rollback();

    bool is_active() const { return dataset_ != nullptr; }

   private:
    friend class Dataset;
    Transaction(GDALDatasetH dataset, BorrowGuard guard)
        : dataset_(dataset), guard_(std::move(guard)){};
    GDALDatasetH checked_dataset(const char* call);
    void rollback_noexcept() noexcept;

    GDALDatasetH dataset_ = nullptr;
    BorrowGuard guard_;
  };

}  // namespace geobind
