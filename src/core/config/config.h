#pragma once

#include <string>

#include "../optimizer/packer.h"
#include "../optimizer/sheet.h"
#include "../threading/thread_pool.h"
#include "../types.h"

namespace cl {

// Tool configuration (INI file). Supplies defaults for whatever a job file
// leaves out; the optimizer itself never reads it.
class Config {
  public:
    // Singleton access
    static Config& instance();

    // Load/save configuration. A missing file on load keeps the defaults.
    bool load(const Path& path);
    bool save(const Path& path) const;

    // Restore built-in defaults
    void resetToDefaults();

    // Default stock sheet
    f64 getSheetWidth() const { return m_sheetWidth; }
    void setSheetWidth(f64 w) { m_sheetWidth = w; }

    f64 getSheetHeight() const { return m_sheetHeight; }
    void setSheetHeight(f64 h) { m_sheetHeight = h; }

    f64 getSheetThickness() const { return m_sheetThickness; }
    void setSheetThickness(f64 t) { m_sheetThickness = t; }

    f64 getKerfWidth() const { return m_kerfWidth; }
    void setKerfWidth(f64 kerf) { m_kerfWidth = kerf; }

    const std::string& getMaterialRef() const { return m_materialRef; }
    void setMaterialRef(const std::string& material) { m_materialRef = material; }

    // All sheet defaults as one template
    optimizer::SheetTemplate getSheetTemplate() const;

    optimizer::Algorithm getAlgorithm() const { return m_algorithm; }
    void setAlgorithm(optimizer::Algorithm algorithm) { m_algorithm = algorithm; }

    // Log level (maps to log::Level enum)
    int getLogLevel() const { return m_logLevel; }
    void setLogLevel(int level) { m_logLevel = level; }

    bool getLogToFile() const { return m_logToFile; }
    void setLogToFile(bool v) { m_logToFile = v; }

    const Path& getLogFilePath() const { return m_logFilePath; }
    void setLogFilePath(const Path& p) { m_logFilePath = p; }

    // Batch runs
    ParallelismTier getParallelismTier() const { return m_parallelismTier; }
    void setParallelismTier(ParallelismTier tier) { m_parallelismTier = tier; }

  private:
    Config() = default;
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Sheet defaults (mm)
    f64 m_sheetWidth = 2750.0;
    f64 m_sheetHeight = 1830.0;
    f64 m_sheetThickness = 18.0;
    f64 m_kerfWidth = optimizer::DEFAULT_KERF_WIDTH;
    std::string m_materialRef;

    optimizer::Algorithm m_algorithm = optimizer::Algorithm::BottomLeftFill;

    // Logging
    int m_logLevel = 1; // Info
    bool m_logToFile = false;
    Path m_logFilePath; // Empty = "cutlayout.log" in the working directory

    ParallelismTier m_parallelismTier = ParallelismTier::Auto;
};

} // namespace cl
