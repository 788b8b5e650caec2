#pragma once

#include "CommentExtractor.hpp"
#include "Config.hpp"

#include <QDir>
#include <QString>
#include <QStringList>
#include <argparse/argparse.hpp>
#include <optional>
#include <vector>

// Registers the command-line options on `program`
void
init_args(argparse::ArgumentParser &program);

class planmark
{
public:
    planmark() noexcept;
    ~planmark() noexcept;

    // false on invalid combinations of arguments
    bool ReadArgsParser(argparse::ArgumentParser &argparser) noexcept;

    // Process exit status
    int Run() noexcept;

    inline const Config &config() const noexcept
    {
        return m_config;
    }

private:
    void initConfig() noexcept;
    bool ProcessFile(const QString &filePath) noexcept;
    void PrintPreview(const QString &filePath,
                      const std::vector<ExtractedRow> &rows) const noexcept;

    Config m_config;
    QDir m_config_dir;
    QString m_config_file_path;
    bool m_config_from_args{false};
    QString m_output_override;
    std::optional<Language> m_language_override;
    QStringList m_files;
    bool m_preview{false};
    bool m_quiet{false};
};
