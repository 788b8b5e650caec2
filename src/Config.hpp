#pragma once

#include "Labels.hpp"

#include <QString>
#include <toml++/toml.hpp>

struct Config
{
    struct output
    {
        Language language{Language::Japanese};
        QString sheet_name{}; // empty: language default
        QString file_name_format{"comment_list_{}.xlsx"};
        bool freeze_header{true};
        bool autofilter{true};
    } output{};

    struct columns
    {
        double page_width{8};
        double drawing_width{18};
        double comment_width{60};
        double author_width{16};
        double modified_width{24};
        double color_name_width{10};
        double color_hex_width{16};
    } columns{};

    // Output file for `inputPath`, placed next to it
    QString outputPathFor(const QString &inputPath) const noexcept;

    QString sheetName() const noexcept;
};

// Overrides the keys present in `table`; everything else keeps its value
void
applyConfigTable(const toml::table &table, Config &config) noexcept;

// A missing file is not an error. On a parse error `config` is untouched,
// `error` receives the toml++ message and false is returned.
bool
loadConfigFile(const QString &path, Config &config,
               QString *error = nullptr) noexcept;
