// File: src/cli/engram_cli.cpp
//
// Command driver for Engram
//
// Features:
// - Conversational input and single-file or directory training
// - Next-token prediction
// - Consolidation on demand or when the schedule says it is due
// - Snapshot save/load through the configured store

#include "cli/engram_cli.hpp"
#include "learning/text_processing.hpp"
#include "storage/storage_error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace engram {

namespace fs = std::filesystem;

namespace {

constexpr const char* kConversationTag = "conversation";

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StorageError("Cannot read " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

EngramCli::EngramCli(const EngramConfig& config, std::ostream& out)
    : config_(config),
      out_(out),
      engine_(std::make_unique<MemoryEngine>(config.ToEngineConfig())),
      store_(CreateSnapshotStore(config.engine.store, config.engine.state_dir,
                                 config.engine.db_path, config.ToSerializerConfig())) {
}

void EngramCli::Run(std::istream& in) {
    out_ << "Engram - associative memory with consolidation\n"
         << "Type '/help' for available commands, or just start talking.\n\n";

    std::string line;
    while (true) {
        out_ << prompt_ << std::flush;
        if (!std::getline(in, line)) {
            break;
        }
        if (!ProcessCommand(line)) {
            break;
        }
    }
}

bool EngramCli::ProcessCommand(const std::string& input) {
    if (input.empty()) return true;

    try {
        // Check if it's a command (starts with /)
        if (input[0] == '/') {
            return HandleCommand(input.substr(1));
        }
        HandleConversation(input);
    } catch (const StorageError& e) {
        out_ << "Storage error: " << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
        out_ << "Error: " << e.what() << "\n";
    }
    return true;
}

bool EngramCli::HandleCommand(const std::string& cmd) {
    std::istringstream iss(cmd);
    std::string command;
    iss >> command;

    std::string rest;
    std::getline(iss, rest);
    rest = text::Trim(rest);

    if (command == "help") {
        ShowHelp();
    } else if (command == "stats") {
        ShowStatistics();
    } else if (command == "train") {
        TrainFromDirectory(rest);
    } else if (command == "learn") {
        LearnFromFile(rest);
    } else if (command == "say") {
        HandleConversation(rest);
    } else if (command == "predict") {
        PredictNext(rest);
    } else if (command == "consolidate") {
        RunConsolidation();
    } else if (command == "tick") {
        Tick();
    } else if (command == "save") {
        SaveSession();
    } else if (command == "load") {
        LoadSession();
    } else if (command == "quit" || command == "exit") {
        return false;
    } else {
        out_ << "Unknown command: /" << command << "\n";
        out_ << "Type '/help' for available commands.\n";
    }
    return true;
}

void EngramCli::HandleConversation(const std::string& text) {
    if (text.empty()) {
        out_ << "Nothing to learn.\n";
        return;
    }

    total_inputs_++;
    auto report = engine_->Ingest(text, kConversationTag);
    out_ << "Learned " << report.words_learned << " word contexts, "
         << report.memories_created << " memories\n";
}

void EngramCli::ShowHelp() {
    out_ << R"(
Commands:
  /train <dir>            Learn from every .txt file in a directory
  /learn <file>           Learn from one file
  /say <text>             Learn from a line of text (same as typing it)
  /predict <w1> <w2> <w3> Predict the word after three words
  /consolidate            Run a consolidation pass now
  /tick                   Run a consolidation pass if one is due
  /stats                  Show engine statistics
  /save                   Save a snapshot
  /load                   Load the last snapshot
  /help                   Show this help
  /quit                   Exit
)";
}

void EngramCli::ShowStatistics() {
    auto stats = engine_->GetStatistics();
    auto schedule = engine_->GetSchedule();

    out_ << "\nEngine '" << engine_->GetName() << "':\n";
    out_ << "  Vocabulary: " << stats.vocabulary_size << " words\n";
    out_ << "  Linguistic patterns: " << stats.pattern_count << "\n";
    out_ << "  Semantic network: " << stats.semantic_words << " words, "
         << stats.semantic_edges << " edges\n";
    out_ << "  Temporal patterns: " << stats.temporal_patterns << "\n";
    out_ << "  Episodic memories: " << stats.episodic_memories
         << " (" << stats.consolidated_memories << " consolidated)\n";
    out_ << "  Training iterations: " << stats.training_iterations << "\n";
    out_ << "  Corpus size: " << stats.text_corpus_size << " characters\n";
    out_ << "  Consolidation passes: " << stats.consolidation_passes << "\n";
    out_ << "  Next consolidation: " << schedule.NextConsolidation().ToString() << "\n";
    out_ << "  Session inputs: " << total_inputs_ << "\n\n";
}

void EngramCli::TrainFromDirectory(const std::string& directory) {
    std::error_code ec;
    if (directory.empty() || !fs::is_directory(directory, ec)) {
        out_ << "Error: Directory not found: " << directory << "\n";
        return;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".txt") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        throw StorageError("Cannot list " + directory + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    out_ << "Training on " << files.size() << " files from " << directory << "\n";
    for (const auto& file : files) {
        std::string content;
        try {
            content = ReadFile(file);
        } catch (const StorageError& e) {
            spdlog::warn("Skipping {}: {}", file.string(), e.what());
            out_ << "  " << file.filename().string() << ": skipped (unreadable)\n";
            continue;
        }

        auto report = engine_->Ingest(content, file.stem().string());
        out_ << "  " << file.filename().string() << ": " << report.sentences_processed
             << " sentences, " << report.memories_created << " memories, accuracy "
             << std::fixed << std::setprecision(2) << report.mean_accuracy << "\n";
    }
}

void EngramCli::LearnFromFile(const std::string& filepath) {
    std::error_code ec;
    if (filepath.empty() || !fs::is_regular_file(filepath, ec)) {
        out_ << "Error: File not found: " << filepath << "\n";
        return;
    }

    fs::path path(filepath);
    auto report = engine_->Ingest(ReadFile(path), path.stem().string());
    out_ << "Learned from " << filepath << ": " << report.sentences_processed << " sentences, "
         << report.memories_created << " memories, " << report.ngrams_extracted << " n-grams\n";
}

void EngramCli::PredictNext(const std::string& args) {
    std::istringstream iss(args);
    std::array<std::string, 3> context;
    if (!(iss >> context[0] >> context[1] >> context[2])) {
        out_ << "Usage: /predict <w1> <w2> <w3>\n";
        return;
    }

    out_ << "→ " << engine_->PredictNext(context) << "\n";
}

void EngramCli::RunConsolidation() {
    PrintReport(engine_->Consolidate());
}

void EngramCli::Tick() {
    auto report = engine_->ConsolidateIfDue();
    if (!report) {
        out_ << "No consolidation due before "
             << engine_->GetSchedule().NextConsolidation().ToString() << "\n";
        return;
    }
    PrintReport(*report);
}

void EngramCli::PrintReport(const MemoryConsolidator::ConsolidationReport& report) {
    out_ << "Consolidation: " << report.memories_analyzed << " analyzed, "
         << report.clusters_formed << " clusters, "
         << report.memories_retained << " retained, "
         << report.patterns_pruned << " patterns pruned, reduction "
         << std::fixed << std::setprecision(2) << report.memory_reduction_ratio << "\n";
}

void EngramCli::SaveSession() {
    store_->Save(engine_->Snapshot());
    out_ << "✓ Saved '" << engine_->GetName() << "'\n";
}

void EngramCli::LoadSession() {
    engine_->Restore(store_->Load(engine_->GetName()));
    out_ << "✓ Loaded '" << engine_->GetName() << "'\n";
}

bool EngramCli::LoadIfExists() {
    if (!store_->Exists(engine_->GetName())) {
        return false;
    }
    LoadSession();
    return true;
}

} // namespace engram
