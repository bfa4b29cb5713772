#include "DocumentStore.hpp"

namespace exam {

void InMemoryDocumentStore::saveQuestions(
    const std::string &documentId,
    const std::vector<ExtractedQuestion> &questions) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_records[documentId].questions = questions;
}

void InMemoryDocumentStore::saveRegions(const std::string &documentId,
                                        const std::vector<Region> &regions) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_records[documentId].regions = regions;
}

void InMemoryDocumentStore::saveStatistics(const std::string &documentId,
                                           const DocumentStatistics &statistics) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_records[documentId].statistics = statistics;
}

void InMemoryDocumentStore::markDocumentStatus(const std::string &documentId,
                                               const std::string &status) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_records[documentId].status = status;
}

std::vector<ExtractedQuestion>
InMemoryDocumentStore::questions(const std::string &documentId) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_records.find(documentId);
  return it != m_records.end() ? it->second.questions
                               : std::vector<ExtractedQuestion>();
}

std::vector<Region>
InMemoryDocumentStore::regions(const std::string &documentId) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_records.find(documentId);
  return it != m_records.end() ? it->second.regions : std::vector<Region>();
}

std::optional<DocumentStatistics>
InMemoryDocumentStore::statistics(const std::string &documentId) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_records.find(documentId);
  if (it == m_records.end()) {
    return std::nullopt;
  }
  return it->second.statistics;
}

std::string InMemoryDocumentStore::status(const std::string &documentId) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_records.find(documentId);
  return it != m_records.end() ? it->second.status : std::string();
}

} // namespace exam
