#include "backup/encryption_gate.hpp"
#include "backup/file_enumerator.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

std::string opensslError(const std::string& context) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return context;
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return context + ": " + buffer;
}

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

// Content is written beside the destination and only renamed over it once
// complete. Anything left uncommitted is removed.
class StagingFile {
public:
    explicit StagingFile(const std::string& destination)
        : path_(destination + ".partial") {
    }

    ~StagingFile() {
        if (!committed_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;

    const std::string& path() const { return path_; }

    void commit(const std::string& destination) {
        fs::rename(path_, destination);
        committed_ = true;
    }

private:
    std::string path_;
    bool committed_{false};
};

} // namespace

EncryptionConfig::EncryptionConfig(const std::string& key, const std::vector<std::string>& extensions) {
    setKey(key);
    setExtensions(extensions);
}

bool EncryptionConfig::setKey(const std::string& key) {
    bool blank = std::all_of(key.begin(), key.end(), [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    key_ = key;
    return true;
}

std::string EncryptionConfig::getKey() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return key_;
}

bool EncryptionConfig::addExtension(const std::string& extension) {
    std::string normalized = FileEnumerator::normalizeExtension(extension);
    if (normalized.empty()) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return extensions_.insert(normalized).second;
}

bool EncryptionConfig::removeExtension(const std::string& extension) {
    std::string normalized = FileEnumerator::normalizeExtension(extension);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return extensions_.erase(normalized) > 0;
}

void EncryptionConfig::setExtensions(const std::vector<std::string>& extensions) {
    std::set<std::string> normalized;
    for (const auto& ext : extensions) {
        std::string value = FileEnumerator::normalizeExtension(ext);
        if (!value.empty()) {
            normalized.insert(value);
        }
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    extensions_ = std::move(normalized);
}

std::vector<std::string> EncryptionConfig::getExtensions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::vector<std::string>(extensions_.begin(), extensions_.end());
}

bool EncryptionConfig::hasExtension(const std::string& normalizedExtension) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return extensions_.count(normalizedExtension) > 0;
}

EncryptionGate::EncryptionGate(EncryptionConfig& config)
    : config_(config) {
}

bool EncryptionGate::shouldEncrypt(const std::string& path) const {
    std::string ext = FileEnumerator::normalizedExtension(path);
    return !ext.empty() && config_.hasExtension(ext);
}

TransferResult EncryptionGate::transferFile(const FileTask& task) const {
    TransferResult result;
    auto start = Clock::now();
    bool encrypt = shouldEncrypt(task.sourcePath);

    try {
        fs::path destination(task.destinationPath);
        if (destination.has_parent_path()) {
            fs::create_directories(destination.parent_path());
        }

        std::ifstream source(task.sourcePath, std::ios::binary);
        if (!source) {
            result.errorKind = ErrorKind::IO;
            result.error = "Failed to open source file: " + task.sourcePath;
            result.transferMs = elapsedMs(start);
            return result;
        }

        StagingFile staging(task.destinationPath);
        std::ofstream target(staging.path(), std::ios::binary | std::ios::trunc);
        if (!target) {
            result.errorKind = ErrorKind::IO;
            result.error = "Failed to open destination file: " + staging.path();
            result.transferMs = elapsedMs(start);
            return result;
        }

        std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter> ctx;
        double cipherMs = 0.0;
        std::vector<unsigned char> cipherBuffer;

        auto cipherFailure = [&](const std::string& message) {
            result.errorKind = ErrorKind::Encryption;
            result.error = opensslError(message);
            result.encryptionMs = -1;
            result.transferMs = elapsedMs(start);
            return result;
        };

        if (encrypt) {
            auto cipherStart = Clock::now();
            std::string key = config_.getKey();
            unsigned char derivedKey[SHA256_DIGEST_LENGTH];
            SHA256(reinterpret_cast<const unsigned char*>(key.data()), key.size(), derivedKey);

            unsigned char iv[kIvSize];
            if (RAND_bytes(iv, sizeof(iv)) != 1) {
                return cipherFailure("Failed to generate IV");
            }

            ctx.reset(EVP_CIPHER_CTX_new());
            if (!ctx) {
                return cipherFailure("Failed to create cipher context");
            }
            if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_ctr(), nullptr, derivedKey, iv) != 1) {
                return cipherFailure("Failed to initialise cipher");
            }
            cipherMs += elapsedMs(cipherStart);

            target.write(reinterpret_cast<const char*>(iv), sizeof(iv));
            cipherBuffer.resize(kBlockSize + EVP_MAX_BLOCK_LENGTH);
        }

        std::vector<char> buffer(kBlockSize);
        while (source) {
            source.read(buffer.data(), buffer.size());
            std::streamsize count = source.gcount();
            if (count <= 0) {
                break;
            }

            if (encrypt) {
                auto cipherStart = Clock::now();
                int outLen = 0;
                if (EVP_EncryptUpdate(ctx.get(), cipherBuffer.data(), &outLen,
                                      reinterpret_cast<const unsigned char*>(buffer.data()),
                                      static_cast<int>(count)) != 1) {
                    return cipherFailure("Cipher update failed on " + task.sourcePath);
                }
                cipherMs += elapsedMs(cipherStart);
                target.write(reinterpret_cast<const char*>(cipherBuffer.data()), outLen);
            } else {
                target.write(buffer.data(), count);
            }

            if (!target) {
                result.errorKind = ErrorKind::IO;
                result.error = "Write failed on " + task.destinationPath;
                result.transferMs = elapsedMs(start);
                return result;
            }
            result.bytesCopied += static_cast<uint64_t>(count);
        }

        if (source.bad()) {
            result.errorKind = ErrorKind::IO;
            result.error = "Read failed on " + task.sourcePath;
            result.transferMs = elapsedMs(start);
            return result;
        }

        if (encrypt) {
            auto cipherStart = Clock::now();
            int outLen = 0;
            if (EVP_EncryptFinal_ex(ctx.get(), cipherBuffer.data(), &outLen) != 1) {
                return cipherFailure("Cipher finalisation failed on " + task.sourcePath);
            }
            cipherMs += elapsedMs(cipherStart);
            target.write(reinterpret_cast<const char*>(cipherBuffer.data()), outLen);
            result.encryptionMs = static_cast<int64_t>(cipherMs);
        }

        target.close();
        if (target.fail()) {
            result.errorKind = ErrorKind::IO;
            result.error = "Failed to flush " + task.destinationPath;
            result.transferMs = elapsedMs(start);
            return result;
        }

        fs::last_write_time(staging.path(), fs::last_write_time(task.sourcePath));
        staging.commit(task.destinationPath);

        result.success = true;
        result.transferMs = elapsedMs(start);
        return result;
    } catch (const fs::filesystem_error& e) {
        result.errorKind = ErrorKind::IO;
        result.error = e.what();
        result.transferMs = elapsedMs(start);
        Logger::error("Transfer of " + task.sourcePath + " failed: " + result.error);
        return result;
    } catch (const std::exception& e) {
        result.errorKind = ErrorKind::IO;
        result.error = e.what();
        result.transferMs = elapsedMs(start);
        Logger::error("Transfer of " + task.sourcePath + " failed: " + result.error);
        return result;
    }
}
