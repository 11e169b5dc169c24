#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

// Pushes a finished issue directory to the artifact store.
class UploadPipeline {
public:
    virtual ~UploadPipeline() = default;

    // Cheap check that an upload can run at all (tool present, server up).
    virtual Result<void> verify_setup() = 0;

    virtual UploadResult upload_directory(const std::filesystem::path& local_path,
                                          const std::string& remote_path) = 0;
};

// Regular files under `root`, relative to it, in sorted order.
std::vector<std::string> list_files_recursive(const std::filesystem::path& root);

// Uploads through the JFrog CLI (`jf rt upload`), one file at a time so the
// directory layout is preserved under the remote path.
class JFrogUploader : public UploadPipeline {
public:
    explicit JFrogUploader(ArtifactStoreConfig config, std::string jf_path = "jf");

    Result<void> verify_setup() override;
    UploadResult upload_directory(const std::filesystem::path& local_path,
                                  const std::string& remote_path) override;

private:
    ArtifactStoreConfig config_;
    std::string jf_path_;
};
