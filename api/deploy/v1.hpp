#pragma once

#include "deploy/backup/v1/backup_metadata.pb.h"

namespace deploy::v1 {
using namespace ::deploy::backup::v1;
}
