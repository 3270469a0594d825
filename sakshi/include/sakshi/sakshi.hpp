#pragma once
// Sakshi: a read-only witness of a running mind
//
// Observes a cognitive process through its stores and serves what it sees:
// - Stores: thought stream (redis++) and vector store (httplib) readers
// - Collector: one immutable Snapshot per tick
// - Projection: embeddings to a stable 3-D point cloud with law anchors
// - BroadcastHub: replace-pending fan-out to live observers
// - Gateway: /health, /metrics, /vectors and the /ws push channel

#include "version.hpp"
#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "snapshot.hpp"
#include "snapshot_store.hpp"
#include "stream_store.hpp"
#include "vector_store.hpp"
#include "collector.hpp"
#include "projection.hpp"
#include "broadcast_hub.hpp"
#include "gateway.hpp"
