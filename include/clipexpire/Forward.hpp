#pragma once
// Forward declarations for loose coupling (SOLID: Dependency Inversion)

namespace clipexpire {

// Data structures
struct ClipboardItem;
struct FileConfig;
struct ConfigOverrides;
struct ResolvedConfig;
struct CommandLine;
struct TickReport;
struct RewritePlan;
struct HistoryWriter;

// Components (Single Responsibility each)
class PatternFilter;
class ClipboardGateway;
class KlipperGateway;
class ExpiryStore;
class Scheduler;
class Daemon;

} // namespace clipexpire
