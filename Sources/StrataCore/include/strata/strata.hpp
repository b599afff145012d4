#pragma once

// Strata - object mapping core for schema-less entity stores
//
// Usage:
//   #include <strata/strata.hpp>
//
//   struct Trip {
//       std::string name;
//       int32_t days = 0;
//       std::optional<std::set<int32_t>> tags;
//   };
//   STRATA_MODEL(Trip, name, days, tags);
//
//   int main() {
//       strata::entity_store store;  // in-memory, or store_config{"path.db"}
//
//       strata::put_model(store, Trip{"Costa Rica", 10, std::set<int32_t>{1, 2}});
//
//       const auto& meta = strata::meta<Trip>();
//       auto trips = strata::model_query<Trip>(store)
//           .filter(strata::criterion::contains(meta.find_attribute("tags"), 2))
//           .sort(strata::sort_criterion::desc(meta.find_attribute("days")))
//           .as_list();
//   }

#include "strata/log.hpp"
#include "strata/types.hpp"
#include "strata/serialization.hpp"
#include "strata/convert.hpp"
#include "strata/schema.hpp"
#include "strata/criterion.hpp"
#include "strata/db.hpp"
#include "strata/store.hpp"
