#include "io/DocumentCorpus.hpp"

#include "io/JsonIO.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

Document load_document(const std::string& path) {
    const fs::path p(path);

    Document d;
    d.id = p.stem().string();
    d.path = p.string();

    if (p.extension() == ".json") {
        d.kind = DocumentKind::Table;
        d.table = loadSourceTable(d.path);
    } else if (p.extension() == ".txt") {
        d.kind = DocumentKind::Text;
        d.text = readTextFile(d.path);
    } else {
        throw std::runtime_error("unsupported document type: " + d.path);
    }
    return d;
}

DocumentCorpus DocumentCorpus::load_from_dir(const std::string& dir) {
    DocumentCorpus c;

    fs::path root(dir);
    if (!fs::exists(root)) throw std::runtime_error("dir not found: " + dir);

    std::vector<fs::path> files;
    for (auto& entry : fs::directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        const auto ext = entry.path().extension();
        if (ext != ".txt" && ext != ".json") continue;
        files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    for (const auto& p : files) {
        try {
            c.m_docs.push_back(load_document(p.string()));
        } catch (const std::exception& e) {
            std::cerr << "[warn] skipping " << p.string() << ": " << e.what() << "\n";
            c.m_failed.emplace_back(p.string(), e.what());
        }
    }

    return c;
}
