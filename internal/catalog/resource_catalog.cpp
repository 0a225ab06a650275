#include "resource_catalog.hpp"

#include <algorithm>

namespace shopfloor::catalog {

// ------------------------------------------------------------------
// RepositoryResourceSource
// ------------------------------------------------------------------

std::vector<model::Worker> RepositoryResourceSource::ListActiveWorkers() {
  auto workers = repository_.ListWorkers(tx_);
  std::erase_if(workers, [](const model::Worker& w) { return w.status != model::WorkerStatus::kActive; });
  return workers;
}

std::vector<model::Equipment> RepositoryResourceSource::ListEquipment() {
  return repository_.ListEquipment(tx_);
}

std::vector<model::Certification> RepositoryResourceSource::GetCertifications() {
  return repository_.ListCertifications(tx_);
}

std::vector<model::Proficiency> RepositoryResourceSource::ListProficiencies() {
  return repository_.ListProficiencies(tx_);
}

std::vector<Booking> RepositoryResourceSource::ListBookings(std::uint64_t excluding_order_id) {
  std::vector<Booking> bookings;
  for (const auto& entry : repository_.ListEntries(tx_)) {
    if (entry.order_id == excluding_order_id || entry.status == model::EntryStatus::kCompleted) continue;
    for (const auto& assignment : entry.assignments) {
      bookings.push_back({assignment.worker_id, entry.order_id, entry.date, entry.start_second, entry.end_second});
    }
  }
  return bookings;
}

// ------------------------------------------------------------------
// ResourceSnapshot
// ------------------------------------------------------------------

const model::Equipment* ResourceSnapshot::FindEquipment(std::uint64_t equipment_id) const {
  auto it = equipment.find(equipment_id);
  return it == equipment.end() ? nullptr : &it->second;
}

std::int32_t ResourceSnapshot::ProficiencyOf(std::uint64_t worker_id, std::uint64_t step_id) const {
  auto it = proficiency.find({worker_id, step_id});
  return it == proficiency.end() ? model::kDefaultProficiency : it->second;
}

bool ResourceSnapshot::HasValidCertification(std::uint64_t worker_id, std::uint64_t equipment_id, util::Date date) const {
  return std::any_of(certifications.begin(), certifications.end(), [&](const model::Certification& c) {
    return c.worker_id == worker_id && c.equipment_id == equipment_id && c.ValidOn(date);
  });
}

// ------------------------------------------------------------------
// ResourceCatalog
// ------------------------------------------------------------------

ResourceSnapshot ResourceCatalog::Capture(ResourceSource& source, std::uint64_t excluding_order_id, std::uint64_t now_ms) {
  ResourceSnapshot snapshot;
  snapshot.taken_at_ms = now_ms;

  snapshot.workers = source.ListActiveWorkers();
  std::sort(snapshot.workers.begin(), snapshot.workers.end(), [](const model::Worker& a, const model::Worker& b) { return a.id < b.id; });

  for (auto& equipment : source.ListEquipment()) {
    snapshot.equipment.emplace(equipment.id, std::move(equipment));
  }
  snapshot.certifications = source.GetCertifications();
  for (const auto& p : source.ListProficiencies()) {
    snapshot.proficiency[{p.worker_id, p.step_id}] = p.level;
  }
  snapshot.bookings = source.ListBookings(excluding_order_id);
  return snapshot;
}

} // namespace shopfloor::catalog
