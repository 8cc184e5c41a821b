#include "galaxis/core/resources.h"

#include <sstream>

#include "galaxis/util/strings.h"

namespace galaxis {

const std::array<ResourceKind, kResourceKindCount>& all_resource_kinds() {
  static const std::array<ResourceKind, kResourceKindCount> kAll = {
      ResourceKind::Hydrogen, ResourceKind::Oxygen, ResourceKind::Carbon, ResourceKind::Silicon,
      ResourceKind::Water,    ResourceKind::Diamond, ResourceKind::Life,  ResourceKind::Robot,
      ResourceKind::Dolphin,  ResourceKind::AIPartner,
  };
  return kAll;
}

const std::array<ResourceKind, kBaseKindCount>& base_resource_kinds() {
  static const std::array<ResourceKind, kBaseKindCount> kBase = {
      ResourceKind::Hydrogen, ResourceKind::Oxygen, ResourceKind::Carbon, ResourceKind::Silicon};
  return kBase;
}

const char* resource_label(ResourceKind k) {
  switch (k) {
    case ResourceKind::Hydrogen: return "Hydrogen";
    case ResourceKind::Oxygen: return "Oxygen";
    case ResourceKind::Carbon: return "Carbon";
    case ResourceKind::Silicon: return "Silicon";
    case ResourceKind::Water: return "Water";
    case ResourceKind::Diamond: return "Diamond";
    case ResourceKind::Life: return "Life";
    case ResourceKind::Robot: return "Robot";
    case ResourceKind::Dolphin: return "Dolphin";
    case ResourceKind::AIPartner: return "AIPartner";
  }
  return "(unknown)";
}

std::optional<ResourceKind> parse_resource_kind(const std::string& name) {
  const std::string n = to_lower(trim_copy(name));
  if (n == "ai_partner" || n == "ai-partner" || n == "aipartner") return ResourceKind::AIPartner;
  for (ResourceKind k : all_resource_kinds()) {
    if (n == to_lower(resource_label(k))) return k;
  }
  return std::nullopt;
}

void Inventory::add(ResourceKind k, int n) {
  if (n <= 0) return;
  counts_[resource_index(k)] += n;
}

bool Inventory::take(ResourceKind k, int n) {
  if (n <= 0) return true;
  int& c = counts_[resource_index(k)];
  if (c < n) return false;
  c -= n;
  return true;
}

int Inventory::total() const {
  int t = 0;
  for (int c : counts_) t += c;
  return t;
}

std::vector<ResourceKind> Inventory::kinds() const {
  std::vector<ResourceKind> out;
  for (ResourceKind k : all_resource_kinds()) {
    if (count(k) > 0) out.push_back(k);
  }
  return out;
}

std::string inventory_to_string(const Inventory& inv) {
  std::ostringstream ss;
  ss << '{';
  bool first = true;
  for (ResourceKind k : inv.kinds()) {
    if (!first) ss << ", ";
    first = false;
    ss << resource_label(k) << ':' << inv.count(k);
  }
  ss << '}';
  return ss.str();
}

} // namespace galaxis
