/*
 * sections.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Aggregated configuration sections

**************************************************/

#ifndef LEXITRIE_CONFIG_SECTIONS_SECTIONS_HPP
#define LEXITRIE_CONFIG_SECTIONS_SECTIONS_HPP

#include "corpus_config.hpp"
#include "fuzzy_config.hpp"
#include "logging_config.hpp"
#include "storage_config.hpp"

#endif  // LEXITRIE_CONFIG_SECTIONS_SECTIONS_HPP
