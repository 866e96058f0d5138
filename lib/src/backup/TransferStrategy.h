#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "../OffloadConfig.h"
#include "../OffloadTypes.h"
#include "../device/SourceDevice.h"

namespace offload {

// Moves one object to destination_path; false means "try the next strategy"
using TransferFunction = std::function<bool(const SourceLocator& source, const std::string& destination_path)>;

struct TransferStrategy {
    std::string name;
    TransferFunction transfer;
};

// Tried in order until one yields the destination file
using TransferChain = std::vector<TransferStrategy>;

// Poll until path exists or timeout elapses
bool WaitForFile(const std::string& path, std::chrono::milliseconds timeout, std::chrono::milliseconds poll);

/**
 * Standard chain for a protocol device:
 *  1. NativeDownload   - device streams the object straight into the destination
 *  2. StreamRead       - chunked partial-object reads written by us
 *  3. TempFileRoundTrip - download to the temp directory, then a buffered local copy
 *
 * The device reference must outlive every use of the returned chain.
 */
TransferChain MakeProtocolTransferChain(ProtocolDevice& device, const OffloadConfig& config,
                                        LogCallback log_callback = nullptr);

/**
 * TransferRunner
 *
 * Runs a chain against one source. A strategy counts as successful only if
 * it returns true and the destination appears within the configured wait.
 * Failed attempts have their partial output removed before the next one.
 */
class TransferRunner {
public:
    TransferRunner(const TransferChain& chain, const OffloadConfig& config, LogCallback log_callback = nullptr);

    /**
     * @return Name of the strategy that produced the file
     * @throws std::runtime_error when every strategy failed (last error included)
     */
    std::string Run(const SourceLocator& source, const std::string& destination_path);

private:
    const TransferChain& chain_;
    std::chrono::milliseconds wait_;
    std::chrono::milliseconds poll_;
    LogCallback log_callback_;

    void Log(const std::string& message);
};

} // namespace offload
