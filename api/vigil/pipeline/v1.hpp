#pragma once

#include "vigil/pipeline/v1/batch.pb.h"
#include "vigil/pipeline/v1/callback_service.pb.h"
#include "vigil/pipeline/v1/findings_subscriber.pb.h"
#include "vigil/pipeline/v1/ingest_service.pb.h"
#include "vigil/pipeline/v1/module_service.pb.h"

#include "vigil/pipeline/v1/callback_service.grpc.pb.h"
#include "vigil/pipeline/v1/findings_subscriber.grpc.pb.h"
#include "vigil/pipeline/v1/ingest_service.grpc.pb.h"
#include "vigil/pipeline/v1/module_service.grpc.pb.h"
