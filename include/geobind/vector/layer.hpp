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

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <ogr_api.h>

#include <geobind/common/borrow.hpp>
#include <geobind/common/common.hpp>
#include <geobind/common/metadata.hpp>
#include <geobind/vector/feature.hpp>
#include <geobind/vector/field.hpp>
#include <geobind/vector/geometry.hpp>

namespace geobind {

  class FeatureRange;

  /**
   * @brief A layer of a Dataset or of a ResultSet.
   *
   * Views only. Every call checks that the owner is still open and throws
   * BorrowExpiredError otherwise. A layer keeps a read cursor, so iterating
   * the same layer from two places interleaves them.
   */
  class Layer : public MetadataInterface {
   public:
    Layer(OGRLayerH layer, BorrowGuard guard)
        : layer_(layer), guard_(std::move(guard)){};
    /** @brief A layer that also dies with `dataset_guard`, eg. of a ResultSet. */
    Layer(OGRLayerH layer, BorrowGuard guard, BorrowGuard dataset_guard)
        : layer_(layer),
          guard_(std::move(guard)),
          dataset_guard_(std::move(dataset_guard)){};

    OGRLayerH c_ptr() const;
    GDALMajorObjectH major_object_ptr() const override { return c_ptr(); }

    std::string name() const;
    Defn defn() const;

    /** @brief All features passing the filters, starting from the first. */
    FeatureRange features() const;
    std::optional<Feature> next_feature() const;
    void reset_reading() const;
    /** @brief Feature by id, nullopt if there is none. */
    std::optional<Feature> feature(std::uint64_t fid) const;

    /**
     * @brief Number of features passing the filters. Without `force` a driver
     * that would have to scan the layer gives nullopt.
     */
    std::optional<std::uint64_t> feature_count(bool force = true) const;

    void set_spatial_filter(const Geometry& geometry);
    void set_spatial_filter_rect(double min_x, double min_y, double max_x,
                                 double max_y);
    void clear_spatial_filter();
    /** @brief An OGR SQL WHERE clause, eg. "id > 10". */
    void set_attribute_filter(std::string_view query);
    void clear_attribute_filter();

    /** @brief Extent of the layer, nullopt when it is unknown or empty. */
    std::optional<Envelope> extent(bool force = true) const;
    std::optional<SpatialRef> spatial_ref() const;

    /** @brief Adds fields of the given names and types to the schema. */
    void create_defn_fields(
        const std::vector<std::pair<std::string, OGRFieldType>>& fields);

    /** @brief Writes a new feature holding only `geometry`. */
    void create_feature(const Geometry& geometry);
    /** @brief Writes a new feature with `geometry` and field values. */
    void create_feature_fields(const Geometry& geometry,
                               const std::vector<std::string>& field_names,
                               const std::vector<FieldValue>& values);

    /** @brief Tests an OLC* capability, eg. OLCFastFeatureCount. */
    bool test_capability(std::string_view capability) const;

   private:
    OGRLayerH layer_;
    BorrowGuard guard_;
    std::optional<BorrowGuard> dataset_guard_;
  };

  /**
   * @brief Input iterator over the features of a layer. It holds its own
   * Layer view, so it may outlive the FeatureRange that made it.
   */
  class FeatureIterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Feature;
    using difference_type = std::ptrdiff_t;
    using pointer = Feature*;
    using reference = Feature&;

    // end
    FeatureIterator() = default;
    explicit FeatureIterator(Layer layer) : layer_(std::move(layer)) {
      advance();
    }

    Feature& operator*() { return *current_; }
    Feature* operator->() { return &*current_; }
    FeatureIterator& operator++() {
      advance();
      return *this;
    }
    void operator++(int) { advance(); }

    bool operator==(const FeatureIterator& other) const {
      return !current_ && !other.current_;
    }

   private:
    void advance() {
      current_ = layer_ ? layer_->next_feature() : std::nullopt;
    }

    std::optional<Layer> layer_;
    std::optional<Feature> current_;
  };

  /** @brief Range for `for (auto& feature : layer.features())`. */
  class FeatureRange {
   public:
    explicit FeatureRange(Layer layer) : layer_(std::move(layer)) {
      layer_.reset_reading();
    }

    FeatureIterator begin() const { return FeatureIterator(layer_); }
    FeatureIterator end() const { return FeatureIterator(); }

   private:
    Layer layer_;
  };

}  // namespace geobind
