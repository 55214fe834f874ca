#ifndef GCP_LOG_FORMATTER_FACTORY_HPP
#define GCP_LOG_FORMATTER_FACTORY_HPP

#include "formatter_interface.hpp"
#include "structured_formatter.hpp"
#include "text_formatter.hpp"
#include "../config/formatter_options.hpp"
#include "../core/log_common.hpp"
#include <memory>

namespace gcplog {
    inline std::unique_ptr<IFormatter> makeFormatter(LogFormat format,
                                                     const FormatterOptions &options = FormatterOptions()) {
        if (format == LogFormat::Json) {
            return detail::make_unique<StructuredFormatter>(options);
        }
        return detail::make_unique<TextFormatter>();
    }
} // namespace gcplog

#endif // GCP_LOG_FORMATTER_FACTORY_HPP
