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

#include <geobind/common/cpl_string.hpp>
#include <geobind/common/errors.hpp>
#include <geobind/io/dataset.hpp>
#include <geobind/srs/spatial_ref.hpp>

#include <gdal.h>

#include <climits>

namespace geobind {

  std::size_t Dataset::gcp_count() const {
    return static_cast<std::size_t>(GDALGetGCPCount(c_ptr()));
  }

  std::vector<Gcp> Dataset::gcps() const {
    GDALDatasetH dataset = c_ptr();
    int n = GDALGetGCPCount(dataset);
    const GDAL_GCP* list = GDALGetGCPs(dataset);
    std::vector<Gcp> result;
    if (list == nullptr) return result;
    result.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
      const GDAL_GCP& gcp = list[i];
      result.push_back(Gcp{from_c_string(gcp.pszId), from_c_string(gcp.pszInfo),
                           gcp.dfGCPPixel, gcp.dfGCPLine, gcp.dfGCPX,
                           gcp.dfGCPY, gcp.dfGCPZ});
    }
    return result;
  }

  std::optional<std::string> Dataset::gcp_projection() const {
    const char* projection = GDALGetGCPProjection(c_ptr());
    if (projection == nullptr || *projection == '\0') return std::nullopt;
    return std::string(projection);
  }

  std::optional<SpatialRef> Dataset::gcp_spatial_ref() const {
    OGRSpatialReferenceH srs = GDALGetGCPSpatialRef(c_ptr());
    if (srs == nullptr) return std::nullopt;
    return SpatialRef::from_c_obj(srs);
  }

  void Dataset::set_gcps(const std::vector<Gcp>& gcps, const SpatialRef* srs) {
    if (gcps.size() > static_cast<std::size_t>(INT_MAX)) {
      throw BadArgumentError("Too many ground control points");
    }
    // the GDAL_GCP strings point into these copies for the duration of the
    // call, GDAL duplicates them
    std::vector<std::string> ids;
    std::vector<std::string> infos;
    ids.reserve(gcps.size());
    infos.reserve(gcps.size());
    for (const auto& gcp : gcps) {
      ids.push_back(to_c_string(gcp.id));
      infos.push_back(to_c_string(gcp.info));
    }

    std::vector<GDAL_GCP> list(gcps.size());
    for (std::size_t i = 0; i < gcps.size(); ++i) {
      list[i].pszId = ids[i].data();
      list[i].pszInfo = infos[i].data();
      list[i].dfGCPPixel = gcps[i].pixel;
      list[i].dfGCPLine = gcps[i].line;
      list[i].dfGCPX = gcps[i].x;
      list[i].dfGCPY = gcps[i].y;
      list[i].dfGCPZ = gcps[i].z;
    }

    CPLErr rv = GDALSetGCPs2(c_ptr(), static_cast<int>(list.size()),
                             list.data(),
                             srs != nullptr ? srs->c_ptr() : nullptr);
    if (rv != CE_None) {
      throw detail::last_cpl_err(rv);
    }
  }

}  // namespace geobind
