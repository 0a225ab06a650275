#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/equipment.hpp"
#include "internal/model/worker.hpp"
#include "internal/util/time.hpp"

namespace shopfloor::catalog {

// Time a worker is already committed to another order's entry.
struct Booking {
  std::uint64_t worker_id = 0;
  std::uint64_t order_id  = 0;
  util::Date    date{};
  std::int32_t  start_second = 0;
  std::int32_t  end_second   = 0;
};

/*
  Read side of the workforce and equipment data the engine consumes.
*/
class ResourceSource {
 public:
  virtual ~ResourceSource() = default;

  virtual std::vector<model::Worker>        ListActiveWorkers()                            = 0;
  virtual std::vector<model::Equipment>     ListEquipment()                                = 0;
  virtual std::vector<model::Certification> GetCertifications()                            = 0;
  virtual std::vector<model::Proficiency>   ListProficiencies()                            = 0;
  virtual std::vector<Booking>              ListBookings(std::uint64_t excluding_order_id) = 0;
};

// ResourceSource over an open repository transaction.
class RepositoryResourceSource final : public ResourceSource {
 public:
  RepositoryResourceSource(db::Repository& repository, db::Transaction& tx) : repository_(repository), tx_(tx) {
  }

  std::vector<model::Worker>        ListActiveWorkers() override;
  std::vector<model::Equipment>     ListEquipment() override;
  std::vector<model::Certification> GetCertifications() override;
  std::vector<model::Proficiency>   ListProficiencies() override;
  std::vector<Booking>              ListBookings(std::uint64_t excluding_order_id) override;

 private:
  db::Repository&  repository_;
  db::Transaction& tx_;
};

/*
  Immutable view of the resources one engine invocation plans against.

  Captured once; never refreshed mid-run. Holds active workers only.
*/
struct ResourceSnapshot {
  std::uint64_t taken_at_ms = 0;

  std::vector<model::Worker>                                       workers;
  std::map<std::uint64_t, model::Equipment>                        equipment;
  std::vector<model::Certification>                                certifications;
  std::map<std::pair<std::uint64_t, std::uint64_t>, std::int32_t> proficiency;
  std::vector<Booking>                                             bookings;

  const model::Equipment* FindEquipment(std::uint64_t equipment_id) const;

  // Level for the pair, kDefaultProficiency when unset.
  std::int32_t ProficiencyOf(std::uint64_t worker_id, std::uint64_t step_id) const;

  bool HasValidCertification(std::uint64_t worker_id, std::uint64_t equipment_id, util::Date date) const;
};

class ResourceCatalog {
 public:
  static ResourceSnapshot Capture(ResourceSource& source, std::uint64_t excluding_order_id, std::uint64_t now_ms);
};

} // namespace shopfloor::catalog
