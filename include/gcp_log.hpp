#ifndef GCP_LOG_HPP
#define GCP_LOG_HPP

#include "gcp_log/core/log_common.hpp"
#include "gcp_log/core/encoding_error.hpp"
#include "gcp_log/core/severity.hpp"
#include "gcp_log/core/timestamp.hpp"
#include "gcp_log/core/operation.hpp"
#include "gcp_log/core/source_location.hpp"
#include "gcp_log/core/http_request.hpp"
#include "gcp_log/core/structured_log_entry.hpp"
#include "gcp_log/core/log_record.hpp"
#include "gcp_log/core/crash_report.hpp"
#include "gcp_log/serialization/json_keys.hpp"
#include "gcp_log/serialization/json_codec.hpp"
#include "gcp_log/config/formatter_options.hpp"
#include "gcp_log/formatter/formatter_interface.hpp"
#include "gcp_log/formatter/structured_formatter.hpp"
#include "gcp_log/formatter/text_formatter.hpp"
#include "gcp_log/formatter/formatter_factory.hpp"
#include "gcp_log/transport/transport_interface.hpp"
#include "gcp_log/transport/stream_transport.hpp"
#include "gcp_log/transport/file_transport.hpp"
#include "gcp_log/transport/write_entry.hpp"
#include "gcp_log/macros.hpp"

#endif // GCP_LOG_HPP
