#pragma once

#include "backup/backup_job.hpp"
#include "common/backup_state.hpp"
#include <string>
#include <vector>
#include <set>
#include <shared_mutex>
#include <cstdint>

// Shared encryption settings. Written through the setters, read once per file.
class EncryptionConfig {
public:
    EncryptionConfig() = default;
    EncryptionConfig(const std::string& key, const std::vector<std::string>& extensions);

    // Blank keys are rejected
    bool setKey(const std::string& key);
    std::string getKey() const;

    // Extensions are stored lower-case with a leading dot
    bool addExtension(const std::string& extension);
    bool removeExtension(const std::string& extension);
    void setExtensions(const std::vector<std::string>& extensions);
    std::vector<std::string> getExtensions() const;
    bool hasExtension(const std::string& normalizedExtension) const;

private:
    mutable std::shared_mutex mutex_;
    std::string key_{"DefaultKey"};
    std::set<std::string> extensions_;
};

struct TransferResult {
    bool success{false};
    uint64_t bytesCopied{0};
    double transferMs{0.0};
    int64_t encryptionMs{0};   // 0 when not encrypted, -1 on cipher failure
    ErrorKind errorKind{ErrorKind::None};
    std::string error;
};

class EncryptionGate {
public:
    explicit EncryptionGate(EncryptionConfig& config);

    bool shouldEncrypt(const std::string& path) const;

    // Streams source to destination, creating parent directories. When the
    // extension is configured the content goes through AES-256-CTR keyed by
    // SHA-256(key); the random IV is written first. The destination keeps the
    // source modification time. The content is staged in <destination>.partial
    // and renamed into place on success; a failed transfer leaves any earlier
    // destination untouched.
    TransferResult transferFile(const FileTask& task) const;

    static constexpr size_t kBlockSize = 1024 * 1024;
    static constexpr size_t kIvSize = 16;

private:
    EncryptionConfig& config_;
};
