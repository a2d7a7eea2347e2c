#pragma once

#include <filesystem>
#include <string>

#include "report/Report.hpp"

namespace report {

std::string render_markdown(const Report& r, bool flag_missing = false);

void write_markdown(const std::filesystem::path& out_path, const std::string& md);

} // namespace report
