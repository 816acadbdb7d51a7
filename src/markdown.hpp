#pragma once
/*
 * Markdown
 *
 * Purpose: small helpers over generated executable documents:
 *          fence checks, first heading, file-name slug, safe export.
 * Feature: export writes .tmp -> fdatasync -> atomic rename.
 */
#include <filesystem>
#include <string>
#include <vector>

struct Fence {
  int open_line = 0;
  int close_line = -1; // -1: never closed
  std::string lang;
};

std::vector<Fence> collect_fences(const std::string& doc);
bool fences_well_formed(const std::string& doc);
std::string first_heading(const std::string& doc);
std::string slugify(const std::string& text);

std::filesystem::path export_path_for(const std::filesystem::path& dir, const std::string& doc);
bool write_document(const std::filesystem::path& path, const std::string& doc, std::string& msg);
