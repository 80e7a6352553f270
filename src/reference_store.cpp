#include "voiceguard/reference_store.hpp"
#include "voiceguard/audio_file.hpp"
#include "voiceguard/call_event.hpp"
#include "voiceguard/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace voiceguard {

namespace {

    std::string today() {
        std::time_t t = std::time(nullptr);
        std::tm local{};
        localtime_r(&t, &local);
        char buf[16];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d", &local);
        return buf;
    }

    std::vector<float> embed(EmbeddingExtractor& extractor, const std::vector<float>& audio, const std::string& what) {
        std::vector<float> embedding;
        try {
            embedding = extractor.extract(audio);
        } catch (const ExtractionError&) {
            throw;
        } catch (const std::exception& e) {
            throw ExtractionError("Embedding failed for " + what + ": " + e.what());
        }
        if (embedding.empty()) {
            throw ExtractionError("Embedding model returned nothing for " + what);
        }
        return embedding;
    }

    // Index entries in enrollment order
    struct IndexEntry {
        std::string name;
        std::string file;
        std::string registered;
    };

    std::vector<IndexEntry> readIndex(const fs::path& path) {
        std::ifstream in(path);
        if (!in) {
            throw PersistenceError("Cannot open " + path.string());
        }

        json doc;
        try {
            in >> doc;
        } catch (const json::parse_error& e) {
            throw PersistenceError(path.string() + ": " + e.what());
        }

        std::vector<IndexEntry> entries;
        if (!doc.contains("voices") || !doc["voices"].is_array()) {
            return entries;
        }
        for (const auto& item : doc["voices"]) {
            IndexEntry entry;
            entry.name = item.value("name", "");
            entry.file = item.value("file", "");
            entry.registered = item.value("registered", "");
            if (!entry.name.empty() && !entry.file.empty()) {
                entries.push_back(entry);
            }
        }
        return entries;
    }

    void removeQuietly(const fs::path& path) {
        std::error_code ec;
        fs::remove(path, ec);
    }
}

ReferenceStore::ReferenceStore(EmbeddingExtractor& extractor, const Options& options)
    : extractor_(extractor), options_(options), voices_(std::make_shared<const Voices>()) {
}

ReferenceStore::ReferenceStore(EmbeddingExtractor& extractor)
    : ReferenceStore(extractor, Options()) {
}

std::string ReferenceStore::fileStemFor(const std::string& name) {
    std::string stem;
    stem.reserve(name.size());
    for (unsigned char c : name) {
        if (std::isalnum(c)) {
            stem.push_back(static_cast<char>(std::tolower(c)));
        } else if (c == '-' || c == '_') {
            stem.push_back(static_cast<char>(c));
        } else {
            stem.push_back('_');
        }
    }
    if (stem.empty() || stem.find_first_not_of('_') == std::string::npos) {
        stem = "voice";
    }
    return stem;
}

std::string ReferenceStore::pickFileName(const std::string& name, const std::string& extension,
                                         const Voices& voices) const {
    const std::string stem = fileStemFor(name);
    auto taken = [&](const std::string& candidate) {
        for (const auto& voice : voices) {
            if (voice.name != name && fs::path(voice.file_name).stem().string() == candidate) {
                return true;
            }
        }
        return false;
    };

    std::string candidate = stem;
    for (int n = 2; taken(candidate); ++n) {
        candidate = stem + "_" + std::to_string(n);
    }
    return candidate + extension;
}

void ReferenceStore::writeIndex(const std::string& directory, const Voices& voices) const {
    json doc;
    doc["voices"] = json::array();
    for (const auto& voice : voices) {
        doc["voices"].push_back({
            {"name", voice.name},
            {"file", voice.file_name},
            {"registered", voice.registered}
        });
    }

    const fs::path path = fs::path(directory) / options_.index_file;
    const fs::path tmp = path.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw PersistenceError("Cannot write " + tmp.string());
        }
        out << doc.dump(2) << std::endl;
        if (!out) {
            removeQuietly(tmp);
            throw PersistenceError("Write failed for " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        removeQuietly(tmp);
        throw PersistenceError("Cannot replace " + path.string() + ": " + ec.message());
    }
}

void ReferenceStore::publish(std::shared_ptr<const Voices> voices) {
    std::lock_guard<std::mutex> lock(mutex_);
    voices_ = std::move(voices);
}

ReferenceStore::LoadReport ReferenceStore::load(const std::string& directory) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        options_.directory = directory;
    }

    LoadReport report;
    auto voices = std::make_shared<Voices>();

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        std::cout << "[ReferenceStore] No voices directory at " << directory << ", starting empty" << std::endl;
        publish(voices);
        return report;
    }

    // Every sample file, sorted so the unindexed ones load in a stable order
    std::set<std::string> files;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && isAudioExtension(it->path().extension().string())) {
            files.insert(it->path().filename().string());
        }
    }
    if (ec) {
        report.errors.push_back({directory, "Directory scan failed: " + ec.message()});
    }

    std::vector<IndexEntry> order;
    const fs::path index_path = fs::path(directory) / options_.index_file;
    if (fs::exists(index_path, ec)) {
        try {
            order = readIndex(index_path);
        } catch (const PersistenceError& e) {
            report.errors.push_back({options_.index_file, e.what()});
        }
    }

    std::set<std::string> indexed;
    for (const auto& entry : order) {
        indexed.insert(entry.file);
    }
    for (const auto& file : files) {
        if (indexed.count(file) == 0) {
            order.push_back({fs::path(file).stem().string(), file, ""});
        }
    }

    std::set<std::string> seen_names;
    std::set<std::string> seen_files;
    for (const auto& entry : order) {
        if (seen_names.count(entry.name) || seen_files.count(entry.file)) {
            report.errors.push_back({entry.file, "Duplicate voice entry for " + entry.name});
            continue;
        }
        if (files.count(entry.file) == 0) {
            report.errors.push_back({entry.file, "Sample file for " + entry.name + " is missing"});
            continue;
        }

        try {
            const std::string path = (fs::path(directory) / entry.file).string();
            DecodedAudio audio = loadAudioFile(path, options_.sample_rate);

            ReferenceVoice voice;
            voice.name = entry.name;
            voice.embedding = embed(extractor_, audio.samples, entry.file);
            voice.file_name = entry.file;
            voice.registered = entry.registered;
            voices->push_back(std::move(voice));

            seen_names.insert(entry.name);
            seen_files.insert(entry.file);
            report.loaded.push_back(entry.name);
        } catch (const std::exception& e) {
            report.errors.push_back({entry.file, e.what()});
        }
    }

    for (const auto& err : report.errors) {
        std::cerr << "[ReferenceStore] Skipped " << err.file << ": " << err.message << std::endl;
    }
    std::cout << "[ReferenceStore] Loaded " << report.loaded.size() << " voice(s) from " << directory << std::endl;

    publish(voices);
    return report;
}

void ReferenceStore::enroll(const std::string& name, const std::vector<uint8_t>& audio_bytes) {
    if (name.empty() || name.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ConfigurationError("Voice name must not be empty");
    }
    if (name == kUnknownCaller) {
        throw ConfigurationError("\"Unknown\" is reserved for unrecognised callers");
    }

    std::lock_guard<std::mutex> write_lock(write_mutex_);

    DecodedAudio audio = decodeAudioBytes(audio_bytes, options_.sample_rate);
    std::vector<float> embedding = embed(extractor_, audio.samples, name);

    std::shared_ptr<const Voices> current = snapshot();
    const std::string dir = directory();

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw PersistenceError("Cannot create " + dir + ": " + ec.message());
    }

    const std::string file_name = pickFileName(name, extensionForFormat(audio.major_format), *current);
    const fs::path target = fs::path(dir) / file_name;
    const fs::path tmp = target.string() + ".tmp";

    auto next = std::make_shared<Voices>(*current);
    std::string previous_file;
    auto it = std::find_if(next->begin(), next->end(), [&](const ReferenceVoice& v) { return v.name == name; });

    ReferenceVoice voice;
    voice.name = name;
    voice.embedding = std::move(embedding);
    voice.file_name = file_name;
    voice.registered = today();
    if (it != next->end()) {
        previous_file = it->file_name;
        *it = std::move(voice);
    } else {
        next->push_back(std::move(voice));
    }

    // Sample and index land together, or neither does
    writeFileBytes(tmp.string(), audio_bytes);
    try {
        writeIndex(dir, *next);
    } catch (const PersistenceError&) {
        removeQuietly(tmp);
        throw;
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        removeQuietly(tmp);
        // The new index already names the new sample; put the old one back
        try {
            writeIndex(dir, *current);
        } catch (const PersistenceError& e) {
            std::cerr << "[ReferenceStore] Index left inconsistent: " << e.what() << std::endl;
        }
        throw PersistenceError("Cannot store sample " + target.string() + ": " + ec.message());
    }
    if (!previous_file.empty() && previous_file != file_name) {
        removeQuietly(fs::path(dir) / previous_file);
    }

    publish(next);
    std::cout << "[ReferenceStore] " << (previous_file.empty() ? "Enrolled " : "Re-enrolled ") << name
              << " (" << audio.samples.size() << " samples -> " << file_name << ")" << std::endl;
}

bool ReferenceStore::remove(const std::string& name) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);

    std::shared_ptr<const Voices> current = snapshot();
    auto next = std::make_shared<Voices>();
    std::string file_name;
    for (const auto& voice : *current) {
        if (voice.name == name) {
            file_name = voice.file_name;
        } else {
            next->push_back(voice);
        }
    }
    if (file_name.empty()) {
        return false;
    }

    // Index first, then the sample
    const std::string dir = directory();
    writeIndex(dir, *next);

    std::error_code ec;
    fs::remove(fs::path(dir) / file_name, ec);
    if (ec) {
        writeIndex(dir, *current);
        throw PersistenceError("Cannot delete " + file_name + ": " + ec.message());
    }

    publish(next);
    std::cout << "[ReferenceStore] Removed " << name << std::endl;
    return true;
}

size_t ReferenceStore::clear() {
    std::lock_guard<std::mutex> write_lock(write_mutex_);

    std::shared_ptr<const Voices> current = snapshot();
    const std::string dir = directory();
    size_t deleted = 0;

    for (const auto& voice : *current) {
        std::error_code ec;
        if (fs::remove(fs::path(dir) / voice.file_name, ec)) {
            deleted++;
        } else if (ec) {
            std::cerr << "[ReferenceStore] Failed to delete " << voice.file_name << ": " << ec.message() << std::endl;
        }
    }
    removeQuietly(fs::path(dir) / options_.index_file);

    publish(std::make_shared<const Voices>());
    std::cout << "[ReferenceStore] Cleared " << current->size() << " voice(s)" << std::endl;
    return deleted;
}

std::shared_ptr<const ReferenceStore::Voices> ReferenceStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return voices_;
}

std::vector<std::string> ReferenceStore::names() const {
    std::shared_ptr<const Voices> voices = snapshot();
    std::vector<std::string> out;
    out.reserve(voices->size());
    for (const auto& voice : *voices) {
        out.push_back(voice.name);
    }
    return out;
}

bool ReferenceStore::contains(const std::string& name) const {
    std::shared_ptr<const Voices> voices = snapshot();
    return std::any_of(voices->begin(), voices->end(), [&](const ReferenceVoice& v) { return v.name == name; });
}

size_t ReferenceStore::size() const {
    return snapshot()->size();
}

std::string ReferenceStore::directory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_.directory;
}

} // namespace voiceguard
