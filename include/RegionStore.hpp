#ifndef EXAM_REGION_STORE_HPP
#define EXAM_REGION_STORE_HPP

#include "Region.hpp"
#include "RegionCorrector.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace exam {

/**
 * @brief Saved regions of every document, with manual corrections
 *
 * Each document has its own lock; automatic replacement of detected
 * regions and manual corrections on one document are serialized, while
 * different documents proceed independently. Every stored region carries
 * a "region_id" metadata entry unique within its document.
 */
class RegionStore {
public:
  /**
   * @brief Replace the automatically detected regions of one page
   *
   * Regions marked as manually corrected are kept.
   * @return The stored regions of the page with ids assigned
   */
  std::vector<Region> replaceDetected(const std::string &documentId,
                                      int pageNumber,
                                      const std::vector<Region> &regions);

  /**
   * @brief Regions of a document, optionally restricted to one page,
   *        ordered by page, then y, then x
   */
  std::vector<Region> regions(const std::string &documentId,
                              std::optional<int> pageNumber = std::nullopt) const;

  /// @throws std::out_of_range for an unknown region id (all by-id methods)
  Region region(const std::string &documentId, const std::string &regionId) const;

  Region resize(const std::string &documentId, const std::string &regionId,
                const cv::Rect &box, const std::string &actor);
  Region move(const std::string &documentId, const std::string &regionId,
              int dx, int dy, const std::string &actor);
  std::pair<Region, Region> split(const std::string &documentId,
                                   const std::string &regionId,
                                   const cv::Point &point, SplitAxis axis,
                                   const std::string &actor);
  Region merge(const std::string &documentId,
               const std::vector<std::string> &regionIds,
               const std::string &actor);
  void remove(const std::string &documentId, const std::string &regionId,
              const std::string &actor);
  Region create(const std::string &documentId, const cv::Rect &box,
                int pageNumber, RegionType type, const std::string &actor);
  Region retype(const std::string &documentId, const std::string &regionId,
                RegionType type, const std::string &actor);

  std::vector<RegionCorrection> corrections(const std::string &documentId) const;
  CorrectionStats correctionStats(const std::string &documentId) const;

private:
  struct Entry {
    mutable std::mutex mutex;
    std::map<std::string, Region> regions; ///< Keyed by region id
    RegionCorrector corrector;
    int nextId = 1;
  };

  Entry &entry(const std::string &documentId);
  std::shared_ptr<Entry> find(const std::string &documentId) const;

  static std::string assignId(Entry &entry, Region &region);
  static Region &lookup(Entry &entry, const std::string &regionId);

  mutable std::mutex m_mutex;
  std::map<std::string, std::shared_ptr<Entry>> m_documents;
};

} // namespace exam

#endif // EXAM_REGION_STORE_HPP
