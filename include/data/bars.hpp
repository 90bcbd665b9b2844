#pragma once
#include <cstddef>
#include <string>
#include "core/types.hpp"

namespace data {

// Lapozásból eredő duplikált open_time eldobása; csökkenő időbélyegre DataSourceError.
Bars normalize(Bars bars);

// Kevesebb mint min_bars -> InsufficientDataError (még az indikátorok előtt)
void require_min_bars(const Bars& bars, std::size_t min_bars);

// SHA-256 hex a bar adatokon; azonos adat -> azonos ujjlenyomat
std::string fingerprint(const Bars& bars);

} // namespace data
