#pragma once

// Ready-made schemas for common network protocol headers

#include "wirepack/packets/arp.hpp"
#include "wirepack/packets/dns.hpp"
#include "wirepack/packets/icmp.hpp"
#include "wirepack/packets/ipv4.hpp"
#include "wirepack/packets/tcp.hpp"
#include "wirepack/packets/udp.hpp"
