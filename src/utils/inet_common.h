#pragma once

#ifdef _WIN32
#include <winsock2.h> /* htonll */
#include <ws2tcpip.h> /* addrinfo */

typedef int ssize_t;
typedef SOCKET MYSOCKET;

#else
#include <arpa/inet.h> /* inet_pton */
#include <netdb.h>     /* getaddrinfo */
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#define closesocket close
typedef int MYSOCKET;

#endif
