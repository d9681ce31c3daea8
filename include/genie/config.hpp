/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_CONFIG_HPP_
#define GENIE_CONFIG_HPP_

/**
 * Backend configuration directory.
 */
#ifndef GENIE_CONFIG_CNI_CONF_DIR
#define GENIE_CONFIG_CNI_CONF_DIR "/etc/cni/net.d"
#endif

/**
 * Backend binary directory.
 */
#ifndef GENIE_CONFIG_CNI_BIN_DIR
#define GENIE_CONFIG_CNI_BIN_DIR "/opt/cni/bin"
#endif

/**
 * Synthesized configuration file permissions.
 */
#ifndef GENIE_CONFIG_CNI_CONF_PERM
#define GENIE_CONFIG_CNI_CONF_PERM 0644
#endif

/**
 * Backend used when nothing else is configured.
 */
#ifndef GENIE_CONFIG_DEFAULT_PLUGIN
#define GENIE_CONFIG_DEFAULT_PLUGIN "weave"
#endif

/**
 * Bandwidth ranking service URL.
 */
#ifndef GENIE_CONFIG_RANKING_URL
#define GENIE_CONFIG_RANKING_URL "http://127.0.0.1:4194"
#endif

/**
 * Kubernetes API root used when nothing else is configured.
 */
#ifndef GENIE_CONFIG_K8S_API_ROOT
#define GENIE_CONFIG_K8S_API_ROOT "https://kubernetes.default.svc"
#endif

/**
 * In-cluster service account directory.
 */
#ifndef GENIE_CONFIG_K8S_SERVICE_ACCOUNT_DIR
#define GENIE_CONFIG_K8S_SERVICE_ACCOUNT_DIR "/var/run/secrets/kubernetes.io/serviceaccount"
#endif

/**
 * HTTP transfer timeout in seconds.
 */
#ifndef GENIE_CONFIG_HTTP_TIMEOUT_SEC
#define GENIE_CONFIG_HTTP_TIMEOUT_SEC 30
#endif

/**
 * Synthesized configuration CNI version.
 */
#ifndef GENIE_CONFIG_DEFAULT_CNI_VERSION
#define GENIE_CONFIG_DEFAULT_CNI_VERSION "0.3.1"
#endif

#endif
