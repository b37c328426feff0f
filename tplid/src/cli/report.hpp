//! # Match Reports
//!
//! Renders ranked match results for the `tplid match` command.
//!
//! ## Text
//!
//! ```text
//! == app/build/classes ==
//!   1.0000  OkHttp 3.12.0 [Utilities]  exact  412/412 classes  at com.squareup.okhttp3
//!   0.8731  Gson 2.8.5 [Utilities]  partial  161/180 classes
//! ```
//!
//! ## JSON
//!
//! A flat array with one object per match, tagged with the application it
//! was found in.

#pragma once

#include "tplid/match/batch_matcher.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace tplid::cli {

enum class ReportFormat {
    Text,
    JSON,
};

void write_text_report(std::ostream& out, const std::vector<match::BatchResult>& results);

void write_json_report(std::ostream& out, const std::vector<match::BatchResult>& results);

inline void write_report(std::ostream& out, const std::vector<match::BatchResult>& results,
                         ReportFormat format) {
    if (format == ReportFormat::JSON) {
        write_json_report(out, results);
    } else {
        write_text_report(out, results);
    }
}

} // namespace tplid::cli
