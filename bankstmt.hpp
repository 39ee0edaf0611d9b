/**
 * bankstmt parser - version 1.00
 * --------------------------------------------------------
 * Tabular bank statement import (CSV / XLSX / XLS)
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "bankstmt_parser.hpp"
#include "bankstmt_json.hpp"
#include "bankstmt_csv.hpp"
