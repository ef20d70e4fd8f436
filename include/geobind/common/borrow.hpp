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
// Ravi Peters

/**
 * Run-time checked borrows.
 *
 * GDAL hands out child pointers (bands, layers, geometries of a feature) that
 * die with their parent. An owner keeps an Epoch and gives every view a
 * BorrowGuard stamped with the epoch's current generation. When the owner
 * closes it advances the generation and every guard issued before fails its
 * check, so a stale view throws BorrowExpiredError instead of touching freed
 * memory.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>

namespace geobind {

  class BorrowGuard;

  class Epoch {
   public:
    Epoch() : generation_(std::make_shared<std::atomic<std::uint64_t>>(0)){};

    // The counter moves with the owner, guards keep pointing at it.
    Epoch(Epoch&&) noexcept = default;
    Epoch& operator=(Epoch&&) noexcept = default;
    Epoch(const Epoch&) = delete;
    Epoch& operator=(const Epoch&) = delete;

    /** @brief A guard valid until the next call to advance(). */
    BorrowGuard issue() const;

    /** @brief Invalidates every guard issued so far. */
    void advance() {
      if (generation_) generation_->fetch_add(1);
    }

   private:
    std::shared_ptr<std::atomic<std::uint64_t>> generation_;
  };

  class BorrowGuard {
   public:
    BorrowGuard() = default;

    bool is_alive() const {
      return generation_ && generation_->load() == issued_at_;
    }

    /** @brief Throws BorrowExpiredError naming `what` if the owner closed. */
    void check(const char* what) const;

   private:
    friend class Epoch;
    BorrowGuard(std::shared_ptr<const std::atomic<std::uint64_t>> generation,
                std::uint64_t issued_at)
        : generation_(std::move(generation)), issued_at_(issued_at){};

    std::shared_ptr<const std::atomic<std::uint64_t>> generation_;
    std::uint64_t issued_at_ = 0;
  };

  inline BorrowGuard Epoch::issue() const {
    if (!generation_) return BorrowGuard();
    return BorrowGuard(generation_, generation_->load());
  }

}  // namespace geobind
