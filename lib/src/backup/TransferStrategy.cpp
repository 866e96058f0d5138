#include "TransferStrategy.h"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

#include "FileOps.h"

namespace offload {

bool WaitForFile(const std::string& path, std::chrono::milliseconds timeout, std::chrono::milliseconds poll) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::error_code ec;
    while (true) {
        if (std::filesystem::exists(path, ec)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(poll);
    }
}

// --- Strategies ---

static TransferStrategy NativeDownload(ProtocolDevice& device) {
    return {"NativeDownload", [&device](const SourceLocator& source, const std::string& destination_path) {
        return device.DownloadObject(source.object_handle, destination_path);
    }};
}

static TransferStrategy StreamRead(ProtocolDevice& device, size_t chunk_bytes) {
    return {"StreamRead", [&device, chunk_bytes](const SourceLocator& source, const std::string& destination_path) {
        std::ofstream out(destination_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw FileOpError("create", destination_path, errno);
        }

        std::vector<uint8_t> chunk;
        uint64_t offset = 0;
        while (true) {
            chunk.clear();
            size_t got = device.ReadObjectChunk(source.object_handle, offset, chunk_bytes, chunk);
            if (got > 0) {
                out.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(got));
                if (!out) {
                    throw std::runtime_error("write to " + destination_path + " failed");
                }
                offset += got;
            }
            // Short read marks the end of the object
            if (got < chunk_bytes) break;
        }
        out.close();
        return !out.fail();
    }};
}

static TransferStrategy TempFileRoundTrip(ProtocolDevice& device, const std::string& temp_dir, size_t buffer_bytes) {
    return {"TempFileRoundTrip", [&device, temp_dir, buffer_bytes](const SourceLocator& source,
                                                                  const std::string& destination_path) {
        std::string temp_path = temp_dir + "/mediaoffload_" + std::to_string(::getpid()) + "_" +
                                std::to_string(source.object_handle) + ".part";
        if (!device.DownloadObject(source.object_handle, temp_path)) {
            RemoveFileIfExists(temp_path);
            return false;
        }
        try {
            StreamCopyFile(temp_path, destination_path, buffer_bytes);
        } catch (const std::exception&) {
            RemoveFileIfExists(temp_path);
            throw;
        }
        RemoveFileIfExists(temp_path);
        return true;
    }};
}

TransferChain MakeProtocolTransferChain(ProtocolDevice& device, const OffloadConfig& config, LogCallback log_callback) {
    TransferChain chain;
    chain.push_back(NativeDownload(device));
    chain.push_back(StreamRead(device, config.copy_buffer_bytes));
    chain.push_back(TempFileRoundTrip(device, config.EffectiveTempDir(), config.copy_buffer_bytes));
    if (log_callback) {
        log_callback("Protocol transfer chain: NativeDownload, StreamRead, TempFileRoundTrip");
    }
    return chain;
}

// === TransferRunner ===

TransferRunner::TransferRunner(const TransferChain& chain, const OffloadConfig& config, LogCallback log_callback)
    : chain_(chain),
      wait_(std::chrono::seconds(config.transfer_wait_seconds)),
      poll_(std::chrono::milliseconds(config.transfer_poll_ms)),
      log_callback_(log_callback) {
}

void TransferRunner::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_(message);
    }
}

std::string TransferRunner::Run(const SourceLocator& source, const std::string& destination_path) {
    std::string last_error = "no transfer strategies configured";

    for (const auto& strategy : chain_) {
        try {
            if (strategy.transfer(source, destination_path)) {
                if (WaitForFile(destination_path, wait_, poll_)) {
                    return strategy.name;
                }
                last_error = strategy.name + ": destination did not appear within " +
                             std::to_string(wait_.count()) + " ms";
            } else {
                last_error = strategy.name + ": transfer reported failure";
            }
        } catch (const std::exception& e) {
            last_error = strategy.name + ": " + std::string(e.what());
        }

        Log("  Transfer method failed (" + last_error + "), trying next");
        if (!RemoveFileIfExists(destination_path)) {
            throw std::runtime_error("Cannot remove partial file " + destination_path);
        }
    }
    throw std::runtime_error("All transfer methods failed for " + source.path + ": " + last_error);
}

} // namespace offload
