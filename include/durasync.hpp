#pragma once

//
// durasync: durable event stream client, convenience header
//
// Usage:
//   #include <durasync.hpp>
//
// This pulls in the main building blocks:
//
//   - durasync::SyncClient        → facade: connect, send, history, uploads
//   - durasync::StreamConnector   → reconnect / catch-up state machine
//   - durasync::EventDispatcher   → ordered, epoch-gated handler fan-out
//   - durasync::UploadManager     → resumable chunked uploads
//   - durasync::HttpTransport     → SSE / long-poll / range reads / tus over Beast
//   - durasync::SqliteSyncStore   → SQLite + WAL cursor, journal and upload store
//   - durasync::StreamEvent       → { id, offset, type, payload } wire model
//

#include <durasync/config.hpp>
#include <durasync/errors.hpp>
#include <durasync/protocol.hpp>
#include <durasync/cursor.hpp>
#include <durasync/transport.hpp>
#include <durasync/dispatcher.hpp>
#include <durasync/connector.hpp>
#include <durasync/upload.hpp>
#include <durasync/Metrics.hpp>
#include <durasync/SyncStore.hpp>
#include <durasync/SqliteSyncStore.hpp>
#include <durasync/HttpTransport.hpp>
#include <durasync/client.hpp>
