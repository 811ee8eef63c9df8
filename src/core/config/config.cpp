#include "config.h"

#include <sstream>

#include "../utils/file_utils.h"
#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace cl {

namespace {

// Keep the default when the value does not parse or is not positive
void parsePositive(const std::string& key, const std::string& value, f64& out) {
    double parsed = 0.0;
    if (str::parseDouble(value, parsed) && parsed > 0.0) {
        out = parsed;
    } else {
        log::warningf("Config", "Ignoring invalid %s: '%s'", key.c_str(), value.c_str());
    }
}

} // namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    m_sheetWidth = 2750.0;
    m_sheetHeight = 1830.0;
    m_sheetThickness = 18.0;
    m_kerfWidth = optimizer::DEFAULT_KERF_WIDTH;
    m_materialRef.clear();
    m_algorithm = optimizer::Algorithm::BottomLeftFill;
    m_logLevel = 1;
    m_logToFile = false;
    m_logFilePath.clear();
    m_parallelismTier = ParallelismTier::Auto;
}

optimizer::SheetTemplate Config::getSheetTemplate() const {
    optimizer::SheetTemplate sheet(m_sheetWidth, m_sheetHeight, m_kerfWidth);
    sheet.thickness = m_sheetThickness;
    sheet.materialRef = m_materialRef;
    return sheet;
}

bool Config::load(const Path& configPath) {
    if (!file::exists(configPath)) {
        log::infof("Config", "No config file at %s, using defaults", configPath.string().c_str());
        return true;
    }

    auto content = file::readText(configPath);
    if (!content) {
        log::error("Config", "Failed to read config file");
        return false;
    }

    std::istringstream stream(*content);
    std::string line;
    std::string section;

    while (std::getline(stream, line)) {
        line = str::trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            section = line.substr(1, line.length() - 2);
            continue;
        }

        std::string key;
        std::string value;
        if (!str::splitKeyValue(line, key, value)) {
            log::warningf("Config", "Skipping malformed line in [%s]: '%s'", section.c_str(),
                          line.c_str());
            continue;
        }

        // Parse based on section
        if (section == "sheet") {
            if (key == "width") {
                parsePositive(key, value, m_sheetWidth);
            } else if (key == "height") {
                parsePositive(key, value, m_sheetHeight);
            } else if (key == "thickness") {
                parsePositive(key, value, m_sheetThickness);
            } else if (key == "kerf") {
                double kerf = 0.0;
                if (str::parseDouble(value, kerf) && kerf >= 0.0)
                    m_kerfWidth = kerf;
                else
                    log::warningf("Config", "Ignoring invalid kerf: '%s'", value.c_str());
            } else if (key == "material") {
                m_materialRef = value;
            }
        } else if (section == "optimizer") {
            if (key == "algorithm") {
                auto algorithm = optimizer::algorithmFromName(value);
                if (algorithm)
                    m_algorithm = *algorithm;
                else
                    log::warningf("Config", "Unknown algorithm '%s', keeping %s", value.c_str(),
                                  optimizer::algorithmName(m_algorithm));
            }
        } else if (section == "logging") {
            if (key == "level") {
                int level = 0;
                if (str::parseInt(value, level))
                    m_logLevel = level;
                else
                    log::warningf("Config", "Ignoring invalid log level: '%s'", value.c_str());
            } else if (key == "log_to_file") {
                if (!str::parseBool(value, m_logToFile))
                    log::warningf("Config", "Ignoring invalid log_to_file: '%s'", value.c_str());
            } else if (key == "log_file") {
                m_logFilePath = value;
            }
        } else if (section == "batch") {
            if (key == "parallelism") {
                int tier = 0;
                if (str::parseInt(value, tier) && tier >= 0 && tier <= 2)
                    m_parallelismTier = static_cast<ParallelismTier>(tier);
                else
                    log::warningf("Config", "Ignoring invalid parallelism: '%s'", value.c_str());
            }
        }
    }

    log::debugf("Config", "Loaded %s", configPath.string().c_str());
    return true;
}

bool Config::save(const Path& configPath) const {
    std::ostringstream ss;

    ss << "# CutLayout Configuration\n\n";

    ss << "[sheet]\n";
    ss << "width=" << str::formatMm(m_sheetWidth) << "\n";
    ss << "height=" << str::formatMm(m_sheetHeight) << "\n";
    ss << "thickness=" << str::formatMm(m_sheetThickness) << "\n";
    ss << "kerf=" << str::formatMm(m_kerfWidth) << "\n";
    ss << "material=" << m_materialRef << "\n";
    ss << "\n";

    ss << "[optimizer]\n";
    ss << "algorithm=" << optimizer::algorithmName(m_algorithm) << "\n";
    ss << "\n";

    ss << "[logging]\n";
    ss << "level=" << m_logLevel << "\n";
    ss << "log_to_file=" << (m_logToFile ? "true" : "false") << "\n";
    ss << "log_file=" << m_logFilePath.string() << "\n";
    ss << "\n";

    ss << "[batch]\n";
    ss << "parallelism=" << static_cast<int>(m_parallelismTier) << "\n";

    if (!file::replaceText(configPath, ss.str())) {
        log::error("Config", "Failed to save config file");
        return false;
    }

    log::debugf("Config", "Saved to %s", configPath.string().c_str());
    return true;
}

} // namespace cl
