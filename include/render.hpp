#pragma once

#include "question.hpp"
#include <cstddef>
#include <ostream>
#include <utility>
#include <vector>

std::pair<size_t, size_t> get_terminal_size();

// JSON array in the shape the import workflow consumes.
void render_json(const std::vector<ParsedQuestion> &questions,
                 std::ostream &out);

void render_table(const std::vector<ParsedQuestion> &questions,
                  size_t term_width, std::ostream &out);
