// poexam/po/catalog.cpp - Parsed PO file
#include "poexam/po/catalog.hpp"

#include <algorithm>

namespace poexam::po
{

const Entry * Catalog::header() const noexcept
{
  const auto it =
    std::find_if(entries.begin(), entries.end(), [](const Entry & e) { return e.is_header(); });
  return it == entries.end() ? nullptr : &*it;
}

}  // namespace poexam::po
