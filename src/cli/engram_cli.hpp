// File: src/cli/engram_cli.hpp
//
// Engram CLI class definition
// Extracted for testability

#ifndef ENGRAM_CLI_HPP
#define ENGRAM_CLI_HPP

#include "cli/engram_config.hpp"
#include "core/memory_engine.hpp"
#include "storage/snapshot_store.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace engram {

/// Command driver for one memory engine
///
/// Lines starting with '/' are commands; any other line is conversational
/// input and is learned like `/say`.
class EngramCli {
public:
    /// @throws std::invalid_argument if config cannot build an engine
    /// @throws StorageError if the snapshot store cannot be opened
    explicit EngramCli(const EngramConfig& config, std::ostream& out = std::cout);

    /// Read and process lines from in until EOF or /quit
    void Run(std::istream& in);

    /// Process a single line
    /// @return false once the driver should stop
    bool ProcessCommand(const std::string& input);

    /// Load the snapshot named after the engine if one exists
    /// @return true if a snapshot was loaded
    bool LoadIfExists();

    MemoryEngine& Engine() { return *engine_; }
    SnapshotStore& Store() { return *store_; }

    size_t GetTotalInputs() const { return total_inputs_; }

private:
    EngramConfig config_;
    std::ostream& out_;
    std::unique_ptr<MemoryEngine> engine_;
    std::unique_ptr<SnapshotStore> store_;

    std::string prompt_ = "engram> ";
    size_t total_inputs_ = 0;

    // Command handling
    bool HandleCommand(const std::string& cmd);
    void HandleConversation(const std::string& text);

    // Commands
    void ShowHelp();
    void ShowStatistics();
    void TrainFromDirectory(const std::string& directory);
    void LearnFromFile(const std::string& filepath);
    void PredictNext(const std::string& args);
    void RunConsolidation();
    void Tick();
    void SaveSession();
    void LoadSession();

    void PrintReport(const MemoryConsolidator::ConsolidationReport& report);
};

} // namespace engram

#endif // ENGRAM_CLI_HPP
