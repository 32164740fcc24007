//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/volume.hpp>
//

#include <voltx/logging.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, VolumeFieldGroup t)
{
  switch (t) {
    case VolumeFieldGroup::kMetadata:
      return out << "metadata";
    case VolumeFieldGroup::kAdminMetadata:
      return out << "admin_metadata";
    case VolumeFieldGroup::kVolumeType:
      return out << "volume_type";
  }
  return out << "(bad VolumeFieldGroup:" << static_cast<usize>(t) << ")";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<Volume> Volume::get_by_id(const RequestContext& context, VolumeStore& store,
                                              std::string_view volume_id)
{
  BATT_ASSIGN_OK_RESULT(VolumeRecord record, store.get_volume(volume_id));

  if (!context.can_see_project(record.project_id)) {
    VOLTX_VLOG(1) << "volume not visible;" << BATT_INSPECT(context) << BATT_INSPECT(volume_id);
    return make_status(StatusCode::kVolumeNotFound);
  }

  return Volume{context, store, std::move(record)};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Volume::Volume(const RequestContext& context, VolumeStore& store, VolumeRecord&& record) noexcept
    : context_{context}
    , store_{&store}
    , record_{std::move(record)}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<VolumeMetadata> Volume::metadata()
{
  if (!this->is_loaded(VolumeFieldGroup::kMetadata)) {
    BATT_ASSIGN_OK_RESULT(this->metadata_, this->store_->get_volume_metadata(this->record_.id));
    this->set_loaded(VolumeFieldGroup::kMetadata);
  }
  return this->metadata_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<VolumeMetadata> Volume::admin_metadata()
{
  if (!this->is_loaded(VolumeFieldGroup::kAdminMetadata)) {
    if (this->context_.is_admin()) {
      BATT_ASSIGN_OK_RESULT(this->admin_metadata_,
                            this->store_->get_volume_admin_metadata(this->record_.id));
    } else {
      this->admin_metadata_.clear();
    }
    this->set_loaded(VolumeFieldGroup::kAdminMetadata);
  }
  return this->admin_metadata_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Optional<VolumeTypeRecord>> Volume::volume_type()
{
  if (!this->is_loaded(VolumeFieldGroup::kVolumeType)) {
    if (this->record_.volume_type_id.empty()) {
      this->volume_type_ = None;
    } else {
      BATT_ASSIGN_OK_RESULT(VolumeTypeRecord volume_type,
                            this->store_->get_volume_type(this->record_.volume_type_id));
      this->volume_type_ = std::move(volume_type);
    }
    this->set_loaded(VolumeFieldGroup::kVolumeType);
  }
  return this->volume_type_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Volume::refresh()
{
  BATT_ASSIGN_OK_RESULT(this->record_, this->store_->get_volume(this->record_.id));

  this->loaded_.reset();
  this->metadata_.clear();
  this->admin_metadata_.clear();
  this->volume_type_ = None;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Volume::destroy()
{
  return this->store_->destroy_volume(this->record_.id);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Volume& t)
{
  return out << "Volume{.record=" << t.record() << ", .loaded={"
             << t.is_loaded(VolumeFieldGroup::kMetadata) << ","
             << t.is_loaded(VolumeFieldGroup::kAdminMetadata) << ","
             << t.is_loaded(VolumeFieldGroup::kVolumeType) << "},}";
}

}  // namespace voltx
