/**
 * @file iniedit.hpp
 * @brief Umbrella header: document model, parser, serializer, diff/merge
 *        and helpers.
 */

#ifndef INIEDIT_INIEDIT_HPP_
#define INIEDIT_INIEDIT_HPP_

#include "iniedit/platform.hpp"
#include "iniedit/vocabulary.hpp"
#include "iniedit/log.hpp"
#include "iniedit/string_util.hpp"
#include "iniedit/comment.hpp"
#include "iniedit/convert.hpp"
#include "iniedit/property.hpp"
#include "iniedit/section.hpp"
#include "iniedit/document.hpp"
#include "iniedit/text_encoding.hpp"
#include "iniedit/parser.hpp"
#include "iniedit/serializer.hpp"
#include "iniedit/diff.hpp"
#include "iniedit/extensions.hpp"
#include "iniedit/snapshot.hpp"
#include "iniedit/validator.hpp"
#include "iniedit/exporter.hpp"
#include "iniedit/builder.hpp"

#endif  // INIEDIT_INIEDIT_HPP_
