#pragma once

// Notifypipe - deliver a notification payload over UDP, TCP or HTTP(S)

// Core types and utilities
#include <notifypipe/common.hpp>
#include <notifypipe/endpoint.hpp>
#include <notifypipe/error.hpp>
#include <notifypipe/request.hpp>

// Transports
#include <notifypipe/datagram/udp.hpp>
#include <notifypipe/http/http.hpp>
#include <notifypipe/stream/tcp.hpp>

// Dispatch by transport tag
#include <notifypipe/protocol.hpp>

// Payloads
#include <notifypipe/format.hpp>
#include <notifypipe/job_state.hpp>

// Validate + serialize + send
#include <notifypipe/notifier.hpp>

// All types are in the notifypipe:: namespace
// Available types:
//   - notifypipe::Message (dp::Vector<dp::u8>)
//   - notifypipe::Endpoint, SendRequest, Target
//   - notifypipe::Protocol (Udp, Tcp, Http), Format (Xml, Json)
//   - notifypipe::UdpDatagram, TcpStream
//   - notifypipe::http::ProxyConfig, HttpOptions
//   - notifypipe::JobState, BuildState, ScmState
