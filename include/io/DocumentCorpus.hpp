#pragma once
#include <string>
#include <utility>
#include <vector>

#include "report/Models.hpp"

enum class DocumentKind {
    Text,   // *.txt
    Table   // *.json
};

struct Document {
    std::string id;    // file stem
    std::string path;
    DocumentKind kind = DocumentKind::Text;

    std::string text;            // Text documents
    report::SourceTable table;   // Table documents
};

// Loads a single file by extension; throws on unreadable or malformed input.
Document load_document(const std::string& path);

class DocumentCorpus {
public:
    // loads *.txt and *.json, sorted by file name; bad files are skipped
    static DocumentCorpus load_from_dir(const std::string& dir);

    const std::vector<Document>& documents() const { return m_docs; }

    // (path, reason) for each file that could not be loaded
    const std::vector<std::pair<std::string, std::string>>& failures() const { return m_failed; }

private:
    std::vector<Document> m_docs;
    std::vector<std::pair<std::string, std::string>> m_failed;
};
