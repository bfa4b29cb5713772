#ifndef EXAM_DOCUMENT_STORE_HPP
#define EXAM_DOCUMENT_STORE_HPP

#include "ConfidenceAggregator.hpp"
#include "ExtractedQuestion.hpp"
#include "Region.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace exam {

/**
 * @brief Persistence for the results of a processing run
 */
class DocumentStore {
public:
  virtual ~DocumentStore() = default;

  virtual void saveQuestions(const std::string &documentId,
                             const std::vector<ExtractedQuestion> &questions) = 0;
  virtual void saveRegions(const std::string &documentId,
                           const std::vector<Region> &regions) = 0;
  virtual void saveStatistics(const std::string &documentId,
                              const DocumentStatistics &statistics) = 0;

  /**
   * @brief Record the processing status of a document ("processing",
   *        "completed", "failed")
   */
  virtual void markDocumentStatus(const std::string &documentId,
                                  const std::string &status) = 0;
};

/**
 * @brief DocumentStore kept in process memory
 */
class InMemoryDocumentStore : public DocumentStore {
public:
  void saveQuestions(const std::string &documentId,
                     const std::vector<ExtractedQuestion> &questions) override;
  void saveRegions(const std::string &documentId,
                   const std::vector<Region> &regions) override;
  void saveStatistics(const std::string &documentId,
                      const DocumentStatistics &statistics) override;
  void markDocumentStatus(const std::string &documentId,
                          const std::string &status) override;

  std::vector<ExtractedQuestion> questions(const std::string &documentId) const;
  std::vector<Region> regions(const std::string &documentId) const;
  std::optional<DocumentStatistics> statistics(const std::string &documentId) const;
  std::string status(const std::string &documentId) const;

private:
  struct Record {
    std::vector<ExtractedQuestion> questions;
    std::vector<Region> regions;
    std::optional<DocumentStatistics> statistics;
    std::string status;
  };

  mutable std::mutex m_mutex;
  std::map<std::string, Record> m_records;
};

} // namespace exam

#endif // EXAM_DOCUMENT_STORE_HPP
