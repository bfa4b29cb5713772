#include "RegionStore.hpp"

#include <algorithm>
#include <stdexcept>

namespace exam {

namespace {

bool isManual(const Region &region) {
  auto it = region.metadata.find("manually_corrected");
  return it != region.metadata.end() && it->second == "true";
}

void sortByPosition(std::vector<Region> &regions) {
  std::sort(regions.begin(), regions.end(), [](const Region &a, const Region &b) {
    if (a.pageNumber != b.pageNumber) {
      return a.pageNumber < b.pageNumber;
    }
    if (a.y != b.y) {
      return a.y < b.y;
    }
    return a.x < b.x;
  });
}

} // anonymous namespace

RegionStore::Entry &RegionStore::entry(const std::string &documentId) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto &slot = m_documents[documentId];
  if (!slot) {
    slot = std::make_shared<Entry>();
  }
  return *slot;
}

std::shared_ptr<RegionStore::Entry>
RegionStore::find(const std::string &documentId) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_documents.find(documentId);
  return it != m_documents.end() ? it->second : nullptr;
}

std::string RegionStore::assignId(Entry &entry, Region &region) {
  std::string id = "r" + std::to_string(entry.nextId++);
  region.metadata["region_id"] = id;
  return id;
}

Region &RegionStore::lookup(Entry &entry, const std::string &regionId) {
  auto it = entry.regions.find(regionId);
  if (it == entry.regions.end()) {
    throw std::out_of_range("Unknown region id: " + regionId);
  }
  return it->second;
}

std::vector<Region>
RegionStore::replaceDetected(const std::string &documentId, int pageNumber,
                             const std::vector<Region> &regions) {
  Entry &doc = entry(documentId);
  std::lock_guard<std::mutex> lock(doc.mutex);

  for (auto it = doc.regions.begin(); it != doc.regions.end();) {
    if (it->second.pageNumber == pageNumber && !isManual(it->second)) {
      it = doc.regions.erase(it);
    } else {
      ++it;
    }
  }

  std::vector<Region> stored;
  for (Region region : regions) {
    region.pageNumber = pageNumber;
    std::string id = assignId(doc, region);
    doc.regions.emplace(id, region);
  }
  for (const auto &item : doc.regions) {
    if (item.second.pageNumber == pageNumber) {
      stored.push_back(item.second);
    }
  }
  sortByPosition(stored);
  return stored;
}

std::vector<Region> RegionStore::regions(const std::string &documentId,
                                         std::optional<int> pageNumber) const {
  std::vector<Region> result;
  auto doc = find(documentId);
  if (!doc) {
    return result;
  }

  std::lock_guard<std::mutex> lock(doc->mutex);
  for (const auto &item : doc->regions) {
    if (!pageNumber || item.second.pageNumber == *pageNumber) {
      result.push_back(item.second);
    }
  }
  sortByPosition(result);
  return result;
}

Region RegionStore::region(const std::string &documentId,
                           const std::string &regionId) const {
  auto doc = find(documentId);
  if (!doc) {
    throw std::out_of_range("Unknown document id: " + documentId);
  }
  std::lock_guard<std::mutex> lock(doc->mutex);
  return lookup(*doc, regionId);
}

Region RegionStore::resize(const std::string &documentId,
                           const std::string &regionId, const cv::Rect &box,
                           const std::string &actor) {
  Entry &doc = entry(documentId);
  std::lock_guard<std::mutex> lock(doc.mutex);
  Region &stored = lookup(doc, regionId);
  stored = doc.corrector.resize(stored, box, actor);
  return stored;
}

Region RegionStore::move(const std::string &documentId,
                         const std::string &regionId, int dx, int dy,
                         const std::string &actor) {
  Entry &doc = entry(documentId);
  std::lock_guard<std::mutex> lock(doc.mutex);
  Region &stored = lookup(doc, regionId);
  stored = doc.corrector.move(stored, dx, dy, actor);
  return stored;
}

std::pair<Region, Region>
RegionStore::split(const std::string &documentId, const std::string &regionId,
                   const cv::Point &point, SplitAxis axis,
                   const std::string &actor) {
  Entry &doc = entry(documentId);
  std::lock_guard<std::mutex> lock(doc.mutex);
  const Region &stored = lookup(doc, regionId);

  auto halves = doc.corrector.split(stored, point, axis, actor);
  doc.regions.erase(regionId);
  doc.regions.emplace(assignId(doc, halves.first), halves.first);
  doc.regions.emplace(assignId(doc, halves.second), halves.second);
  return halves;
}

Region RegionStore::merge(const std::string &documentId,
                          const std::vector<std::string> &regionIds,
                          const std::string &actor) {
  Entry &doc = entry(documentId);
  std::lock_guard<std::mutex> lock(doc.mutex);

  std::vector<Region> parts;
  for (const auto &id : regionIds) {
    parts.push_back(lookup(doc, id));
  }

  Region merged = doc.corrector.merge(parts, actor);
  for (const auto &id : regionIds) {
    doc.regions.erase(id);
  }
  doc.regions.emplace(assignId(doc, merged), merged);
  return merged;
}

void RegionStore::remove(const std::string &documentId,
                         const std::string &regionId,
                         const std::string &actor) {
  Entry &doc = entry(documentId);
  std::lock_guard<std::mutex> lock(doc.mutex);
  doc.corrector.remove(lookup(doc, regionId), actor);
  doc.regions.erase(regionId);
}

Region RegionStore::create(const std::string &documentId, const cv::Rect &box,
                           int pageNumber, RegionType type,
                           const std::string &actor) {
  Entry &doc = entry(documentId);
  std::lock_guard<std::mutex> lock(doc.mutex);
  Region created = doc.corrector.create(box, pageNumber, type, actor);
  doc.regions.emplace(assignId(doc, created), created);
  return created;
}

Region RegionStore::retype(const std::string &documentId,
                           const std::string &regionId, RegionType type,
                           const std::string &actor) {
  Entry &doc = entry(documentId);
  std::lock_guard<std::mutex> lock(doc.mutex);
  Region &stored = lookup(doc, regionId);
  stored = doc.corrector.retype(stored, type, actor);
  return stored;
}

std::vector<RegionCorrection>
RegionStore::corrections(const std::string &documentId) const {
  auto doc = find(documentId);
  return doc ? doc->corrector.history() : std::vector<RegionCorrection>();
}

CorrectionStats RegionStore::correctionStats(const std::string &documentId) const {
  auto doc = find(documentId);
  return doc ? doc->corrector.correctionStats() : CorrectionStats();
}

} // namespace exam
