/**
 * test_transfer_strategies.cpp
 *
 * Unit tests for the protocol transfer chain and TransferRunner
 */

#include "lib/src/backup/TransferStrategy.h"
#include "tests/TestSupport.h"

#include <chrono>

using namespace offload;

static OffloadConfig FastConfig(const TempDir& temp) {
    OffloadConfig config;
    config.transfer_wait_seconds = 1;
    config.transfer_poll_ms = 20;
    config.copy_buffer_bytes = 64;
    config.temp_dir = temp.Path();
    return config;
}

static SourceLocator Locator(uint32_t handle) {
    SourceLocator source;
    source.mode = AddressingMode::Protocol;
    source.path = "Fake Camera/DCIM/object";
    source.object_handle = handle;
    return source;
}

bool TestNativeDownloadFirst() {
    std::cout << "Testing native download is tried first..." << std::endl;

    TempDir dst("xfer_dst");
    TempDir tmp("xfer_tmp");
    OffloadConfig config = FastConfig(tmp);
    FakeMtpDevice device;
    std::string data = MakeContent(JpegHeader(), 1000);
    uint32_t handle = device.AddFile(FakeMtpDevice::ROOT_HANDLE, "a.jpg", data);

    TransferChain chain = MakeProtocolTransferChain(device, config);
    ASSERT_EQ(chain.size(), static_cast<size_t>(3), "Three standard strategies");
    ASSERT_EQ(chain[0].name, std::string("NativeDownload"), "First strategy");
    ASSERT_EQ(chain[1].name, std::string("StreamRead"), "Second strategy");
    ASSERT_EQ(chain[2].name, std::string("TempFileRoundTrip"), "Third strategy");

    TransferRunner runner(chain, config);
    std::string method = runner.Run(Locator(handle), dst / "a.jpg");
    ASSERT_EQ(method, std::string("NativeDownload"), "Native download used");
    ASSERT_EQ(ReadFile(dst / "a.jpg"), data, "Content written");
    ASSERT_EQ(device.chunk_calls, 0, "No partial reads needed");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestStreamReadFallback() {
    std::cout << "Testing fallback to chunked reads..." << std::endl;

    TempDir dst("xfer_dst");
    TempDir tmp("xfer_tmp");
    OffloadConfig config = FastConfig(tmp);
    FakeMtpDevice device;
    // Several chunks plus a short tail
    std::string data = MakeContent(TiffHeader(), 64 * 5 + 7);
    uint32_t handle = device.AddFile(FakeMtpDevice::ROOT_HANDLE, "DSC0001.ARW", data);
    device.download_fails = true;

    TransferChain chain = MakeProtocolTransferChain(device, config);
    TransferRunner runner(chain, config);
    std::string method = runner.Run(Locator(handle), dst / "DSC0001.ARW");

    ASSERT_EQ(method, std::string("StreamRead"), "Chunked read used");
    ASSERT_EQ(ReadFile(dst / "DSC0001.ARW"), data, "Content reassembled in order");
    ASSERT_EQ(device.download_calls, 1, "Native download attempted once");
    ASSERT_EQ(device.chunk_calls, 6, "Six reads for five full chunks and a tail");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestAllStrategiesFail() {
    std::cout << "Testing exhausted chain..." << std::endl;

    TempDir dst("xfer_dst");
    TempDir tmp("xfer_tmp");
    OffloadConfig config = FastConfig(tmp);
    FakeMtpDevice device;
    uint32_t handle = device.AddFile(FakeMtpDevice::ROOT_HANDLE, "a.jpg", MakeContent(JpegHeader(), 100));
    device.download_fails = true;
    device.chunk_fails = true;

    TransferChain chain = MakeProtocolTransferChain(device, config);
    TransferRunner runner(chain, config);

    bool threw = false;
    std::string message;
    try {
        runner.Run(Locator(handle), dst / "a.jpg");
    } catch (const std::runtime_error& e) {
        threw = true;
        message = e.what();
    }
    ASSERT_TRUE(threw, "Runner throws when every strategy fails");
    ASSERT_TRUE(message.find("All transfer methods failed") != std::string::npos, "Message names the failure");
    ASSERT_FALSE(std::filesystem::exists(dst / "a.jpg"), "No partial destination left behind");
    ASSERT_EQ(device.download_calls, 2, "Native and temp-file downloads both attempted");
    ASSERT_TRUE(std::filesystem::is_empty(tmp.Path()), "Temp directory cleaned up");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestCustomChainOrderAndBoundedWait() {
    std::cout << "Testing custom chain order and bounded wait..." << std::endl;

    TempDir dst("xfer_dst");
    TempDir tmp("xfer_tmp");
    OffloadConfig config = FastConfig(tmp);

    std::vector<std::string> calls;
    TransferChain chain;
    chain.push_back({"ClaimsSuccess", [&](const SourceLocator&, const std::string&) {
        calls.push_back("ClaimsSuccess");
        return true;   // but never writes the file
    }});
    chain.push_back({"Throws", [&](const SourceLocator&, const std::string& dest) -> bool {
        calls.push_back("Throws");
        WriteFile(dest, "partial");
        throw std::runtime_error("USB stall");
    }});
    bool partial_left = false;
    chain.push_back({"Writes", [&](const SourceLocator&, const std::string& dest) {
        calls.push_back("Writes");
        partial_left = std::filesystem::exists(dest);
        WriteFile(dest, "complete");
        return true;
    }});

    TransferRunner runner(chain, config);
    auto start = std::chrono::steady_clock::now();
    std::string method = runner.Run(Locator(1), dst / "x.jpg");
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(method, std::string("Writes"), "Third strategy succeeded");
    ASSERT_EQ(calls.size(), static_cast<size_t>(3), "Every strategy tried once");
    ASSERT_EQ(calls[0], std::string("ClaimsSuccess"), "Order kept");
    ASSERT_EQ(calls[1], std::string("Throws"), "Order kept");
    ASSERT_FALSE(partial_left, "Partial output removed before the next strategy");
    ASSERT_EQ(ReadFile(dst / "x.jpg"), std::string("complete"), "Final content");
    ASSERT_TRUE(elapsed >= std::chrono::milliseconds(900), "Missing file waited for about the configured time");
    ASSERT_TRUE(elapsed < std::chrono::seconds(5), "Wait is bounded");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestWaitForFile() {
    std::cout << "Testing WaitForFile..." << std::endl;

    TempDir dir("xfer_wait");
    WriteFile(dir / "present", "x");
    ASSERT_TRUE(WaitForFile(dir / "present", std::chrono::milliseconds(0), std::chrono::milliseconds(10)),
                "Existing file found immediately");
    ASSERT_FALSE(WaitForFile(dir / "absent", std::chrono::milliseconds(50), std::chrono::milliseconds(10)),
                 "Absent file times out");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "======================================" << std::endl;
    std::cout << " Transfer Strategy Unit Tests" << std::endl;
    std::cout << "======================================" << std::endl << std::endl;

    int passed = 0;
    int total = 0;

    auto run_test = [&](bool (*test_func)(), const std::string& name) {
        total++;
        if (test_func()) {
            passed++;
        } else {
            std::cout << "  TEST FAILED: " << name << std::endl;
        }
        std::cout << std::endl;
    };

    run_test(TestNativeDownloadFirst, "Native Download First");
    run_test(TestStreamReadFallback, "StreamRead Fallback");
    run_test(TestAllStrategiesFail, "All Strategies Fail");
    run_test(TestCustomChainOrderAndBoundedWait, "Custom Chain Order And Bounded Wait");
    run_test(TestWaitForFile, "WaitForFile");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
